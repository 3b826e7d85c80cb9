#pragma once
/**
 * @file clock.hpp
 * @brief Monotonic time source and bounded sleep, injectable for deterministic tests.
 */

#include <chrono>

namespace hearth::core {

    /** @class Clock
     *  @brief Source of monotonic time points and blocking sleeps.
     */
    class Clock {
    public:
        using clock_type = std::chrono::steady_clock;
        using time_point = clock_type::time_point;
        using duration   = clock_type::duration;

        virtual ~Clock() = default;

        /// Current monotonic time.
        virtual time_point now() const noexcept = 0;

        /// Block the calling thread for @p d (bounded; never indefinite).
        virtual void sleep_for(std::chrono::milliseconds d) = 0;
    };

    /** @class SteadyClock
     *  @brief Clock backed by std::chrono::steady_clock and std::this_thread::sleep_for.
     */
    class SteadyClock final : public Clock {
    public:
        time_point now() const noexcept override;
        void sleep_for(std::chrono::milliseconds d) override;
    };

    /// Process-wide steady clock instance (stateless).
    Clock& steady_clock();

} // namespace hearth::core
