/**
 * @file rate_limiter.cpp
 * @brief SlidingWindowRateLimiter implementation.
 */
#include "hearth/resilience/rate_limiter.hpp"

namespace hearth::resilience {

    SlidingWindowRateLimiter::SlidingWindowRateLimiter(RateLimitConfig cfg, core::Clock& clock)
        : cfg_(cfg), clock_(&clock) {}

    void SlidingWindowRateLimiter::evict_expired(core::Clock::time_point now) {
        const auto window = std::chrono::milliseconds(cfg_.window_ms);
        // A timestamp exactly one window old is no longer inside the trailing window.
        while (!window_.empty() && now - window_.front() >= window) {
            window_.pop_front();
        }
    }

    bool SlidingWindowRateLimiter::check_and_record() {
        std::lock_guard<std::mutex> lk(mu_);
        const auto now = clock_->now();
        evict_expired(now);
        if (window_.size() >= cfg_.ceiling) {
            ++stats_.rejected;
            return false;
        }
        window_.push_back(now);
        ++stats_.admitted;
        return true;
    }

    std::size_t SlidingWindowRateLimiter::in_window() {
        std::lock_guard<std::mutex> lk(mu_);
        evict_expired(clock_->now());
        return window_.size();
    }

    void SlidingWindowRateLimiter::reset() {
        std::lock_guard<std::mutex> lk(mu_);
        window_.clear();
    }

    SlidingWindowRateLimiter::Stats SlidingWindowRateLimiter::stats() const {
        std::lock_guard<std::mutex> lk(mu_);
        return stats_;
    }

} // namespace hearth::resilience
