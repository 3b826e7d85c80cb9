#pragma once
/**
 * @file rate_limiter.hpp
 * @brief Sliding-window admission control over a bounded FIFO of timestamps.
 * @details Exact trailing-window semantics (no fixed-bucket approximation). One limiter
 *          instance belongs to one client singleton and protects the local process from
 *          self-induced overload, not any particular remote endpoint.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

#include "hearth/config/constants.hpp"
#include "hearth/core/clock.hpp"

namespace hearth::resilience {

    /** @struct RateLimitConfig
     *  @brief Ceiling and window for a SlidingWindowRateLimiter.
     */
    struct RateLimitConfig {
        uint32_t ceiling{hearth::config::constants::RATE_LIMIT_HTTP_CEILING}; ///< Max admissions per window
        uint32_t window_ms{hearth::config::constants::RATE_LIMIT_WINDOW_MS};  ///< Trailing window length
    };

    /** @class SlidingWindowRateLimiter
     *  @brief Admits at most `ceiling` operations in any trailing `window_ms`.
     */
    class SlidingWindowRateLimiter {
    public:
        explicit SlidingWindowRateLimiter(RateLimitConfig cfg,
                                          core::Clock& clock = core::steady_clock());

        /**
         * @brief Evict stale timestamps, then admit-and-record or reject.
         * @return true if admitted (timestamp recorded); false if rejected (nothing recorded).
         */
        bool check_and_record();

        /// Number of admissions currently inside the trailing window.
        [[nodiscard]] std::size_t in_window();

        /// Forget every recorded timestamp (counters are kept).
        void reset();

        [[nodiscard]] const RateLimitConfig& config() const noexcept { return cfg_; }

        struct Stats {
            uint64_t admitted{0};
            uint64_t rejected{0};
        };
        [[nodiscard]] Stats stats() const;

    private:
        /// Drop timestamps that fell out of the window. Caller holds mu_.
        void evict_expired(core::Clock::time_point now);

        RateLimitConfig                     cfg_;
        core::Clock*                        clock_;
        mutable std::mutex                  mu_;
        std::deque<core::Clock::time_point> window_;  ///< Oldest at front; size <= ceiling
        Stats                               stats_{};
    };

} // namespace hearth::resilience
