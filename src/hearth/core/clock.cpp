/**
 * @file clock.cpp
 * @brief SteadyClock implementation.
 */
#include "hearth/core/clock.hpp"

#include <thread>

namespace hearth::core {

    Clock::time_point SteadyClock::now() const noexcept {
        return clock_type::now();
    }

    void SteadyClock::sleep_for(std::chrono::milliseconds d) {
        if (d.count() > 0) std::this_thread::sleep_for(d);
    }

    Clock& steady_clock() {
        static SteadyClock clk; // stateless, safe to share
        return clk;
    }

} // namespace hearth::core
