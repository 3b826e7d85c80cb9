#pragma once
/**
 * @file memory_gauge.hpp
 * @brief Host memory pressure reading for the cache maintenance pass.
 * @note Linux reads /proc/self/statm. Other platforms report no reading.
 */

#include <cstddef>
#include <optional>

#include "hearth/config/constants.hpp"

namespace hearth::os {

    /// @brief Source of host memory pressure as a fraction of a configured ceiling.
    class MemoryGauge {
    public:
        virtual ~MemoryGauge() = default;

        /// @return Used / ceiling (may exceed 1.0), or nullopt if no reading is available.
        virtual std::optional<double> pressure() = 0;
    };

    /// @brief Resident set size of this process against a fixed ceiling in MiB.
    class ProcessMemoryGauge final : public MemoryGauge {
    public:
        explicit ProcessMemoryGauge(std::size_t limit_mb = hearth::config::constants::HOST_MEMORY_LIMIT_MB)
            : limit_bytes_(limit_mb * 1024u * 1024u) {}

        std::optional<double> pressure() override;

        /// @return Resident bytes of the current process, or nullopt if unreadable.
        static std::optional<std::size_t> resident_bytes();

    private:
        std::size_t limit_bytes_;
    };

} // namespace hearth::os
