/**
 * @file memory_gauge_linux.cpp
 * @brief Resident-set gauge backed by /proc/self/statm; reports nothing on other platforms.
 */
#include "hearth/os/memory_gauge.hpp"

#if defined(__linux__)
#include <fstream>
#include <unistd.h>
#endif

namespace hearth::os {

    std::optional<std::size_t> ProcessMemoryGauge::resident_bytes() {
#if defined(__linux__)
        // statm fields are in pages: size resident shared text lib data dt
        std::ifstream in("/proc/self/statm");
        std::size_t size_pages = 0, resident_pages = 0;
        if (!(in >> size_pages >> resident_pages)) return std::nullopt;
        const long page = ::sysconf(_SC_PAGESIZE);
        if (page <= 0) return std::nullopt;
        return resident_pages * static_cast<std::size_t>(page);
#else
        return std::nullopt;
#endif
    }

    std::optional<double> ProcessMemoryGauge::pressure() {
        if (limit_bytes_ == 0) return std::nullopt;
        const auto rss = resident_bytes();
        if (!rss) return std::nullopt;
        return static_cast<double>(*rss) / static_cast<double>(limit_bytes_);
    }

} // namespace hearth::os
