/**
 * @file circuit_breaker.cpp
 * @brief CircuitBreaker state machine and CircuitBreakerRegistry.
 */
#include "hearth/resilience/circuit_breaker.hpp"

#include <utility>

namespace hearth::resilience {

    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    std::string_view to_string(BreakerState s) noexcept {
        switch (s) {
            case BreakerState::Closed:   return "CLOSED";
            case BreakerState::Open:     return "OPEN";
            case BreakerState::HalfOpen: return "HALF_OPEN";
        }
        return "CLOSED";
    }

    nlohmann::json BreakerSnapshot::to_json() const {
        nlohmann::json j = {
            {"name", name},
            {"state", std::string(to_string(state))},
            {"consecutive_failures", consecutive_failures},
            {"probes_in_flight", probes_in_flight},
            {"allowed", allowed},
            {"rejected", rejected},
            {"successes", successes},
            {"failures", failures},
            {"transitions", transitions},
        };
        j["open_for_ms"] = open_for_ms ? nlohmann::json(*open_for_ms) : nlohmann::json(nullptr);
        return j;
    }

    // ---------------------------------------------------------------------------
    // CircuitBreaker
    // ---------------------------------------------------------------------------

    CircuitBreaker::CircuitBreaker(std::string name, BreakerConfig cfg, core::Clock& clock,
                                   std::shared_ptr<obs::EventLogger> log)
        : name_(std::move(name)), cfg_(cfg), clock_(&clock), log_(std::move(log)) {}

    void CircuitBreaker::transition(BreakerState next, core::Clock::time_point now) {
        if (next == state_) return;
        const BreakerState prev = state_;
        state_ = next;
        ++transitions_;
        switch (next) {
            case BreakerState::Open:
                opened_at_ = now;
                probes_in_flight_ = 0;
                break;
            case BreakerState::HalfOpen:
                probes_in_flight_ = 0;
                break;
            case BreakerState::Closed:
                opened_at_.reset();
                consecutive_failures_ = 0;
                probes_in_flight_ = 0;
                break;
        }
        log_->log_warn("", "CIRCUIT_BREAKER", "state change",
                       {{"dependency", name_},
                        {"from", std::string(to_string(prev))},
                        {"to", std::string(to_string(next))},
                        {"consecutive_failures", consecutive_failures_}});
    }

    void CircuitBreaker::refresh(core::Clock::time_point now) {
        if (state_ == BreakerState::Open && opened_at_ &&
            now - *opened_at_ >= milliseconds(cfg_.recovery_timeout_ms)) {
            transition(BreakerState::HalfOpen, now);
        }
        // A probe that never reported back must not wedge the breaker in HALF_OPEN.
        if (state_ == BreakerState::HalfOpen && probes_in_flight_ > 0 &&
            now - probe_started_at_ >= milliseconds(cfg_.recovery_timeout_ms)) {
            probes_in_flight_ = 0;
        }
    }

    Admission CircuitBreaker::try_acquire() {
        std::lock_guard<std::mutex> lk(mu_);
        const auto now = clock_->now();
        refresh(now);

        switch (state_) {
            case BreakerState::Closed:
                ++allowed_;
                return Admission::Allowed;
            case BreakerState::HalfOpen:
                if (probes_in_flight_ < cfg_.half_open_max_probes) {
                    ++probes_in_flight_;
                    probe_started_at_ = now;
                    ++allowed_;
                    return Admission::Probe;
                }
                ++rejected_;
                return Admission::Rejected;
            case BreakerState::Open:
                break;
        }
        ++rejected_;
        return Admission::Rejected;
    }

    void CircuitBreaker::record_success() {
        std::lock_guard<std::mutex> lk(mu_);
        ++successes_;
        consecutive_failures_ = 0;
        // Closes from HALF_OPEN (probe) and from OPEN (a reply that outlived the trip).
        if (state_ != BreakerState::Closed) transition(BreakerState::Closed, clock_->now());
    }

    void CircuitBreaker::record_failure() {
        std::lock_guard<std::mutex> lk(mu_);
        const auto now = clock_->now();
        ++failures_;
        ++consecutive_failures_;
        switch (state_) {
            case BreakerState::Closed:
                if (consecutive_failures_ >= cfg_.failure_threshold) transition(BreakerState::Open, now);
                break;
            case BreakerState::HalfOpen:
                transition(BreakerState::Open, now);
                break;
            case BreakerState::Open:
                break; // stays open; opened_at unchanged
        }
    }

    BreakerState CircuitBreaker::state() {
        std::lock_guard<std::mutex> lk(mu_);
        refresh(clock_->now());
        return state_;
    }

    void CircuitBreaker::reset() {
        std::lock_guard<std::mutex> lk(mu_);
        transition(BreakerState::Closed, clock_->now());
        consecutive_failures_ = 0;
    }

    BreakerSnapshot CircuitBreaker::snapshot() {
        std::lock_guard<std::mutex> lk(mu_);
        const auto now = clock_->now();
        refresh(now);
        BreakerSnapshot s;
        s.name = name_;
        s.state = state_;
        s.consecutive_failures = consecutive_failures_;
        s.probes_in_flight = probes_in_flight_;
        if (opened_at_) s.open_for_ms = duration_cast<milliseconds>(now - *opened_at_).count();
        s.allowed = allowed_;
        s.rejected = rejected_;
        s.successes = successes_;
        s.failures = failures_;
        s.transitions = transitions_;
        return s;
    }

    // ---------------------------------------------------------------------------
    // CircuitBreakerRegistry
    // ---------------------------------------------------------------------------

    CircuitBreakerRegistry::CircuitBreakerRegistry(BreakerConfig defaults, core::Clock& clock,
                                                   std::shared_ptr<obs::EventLogger> log)
        : defaults_(defaults), clock_(&clock), log_(std::move(log)) {}

    std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get(std::string_view dependency) {
        std::lock_guard<std::mutex> lk(mu_);
        const std::string key(dependency);
        auto [it, inserted] = breakers_.try_emplace(key, nullptr);
        if (inserted) {
            const auto ov = overrides_.find(key);
            const BreakerConfig cfg = (ov == overrides_.end()) ? defaults_ : ov->second;
            it->second = std::make_shared<CircuitBreaker>(key, cfg, *clock_, log_);
        }
        return it->second;
    }

    std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::find(std::string_view dependency) const {
        std::lock_guard<std::mutex> lk(mu_);
        const auto it = breakers_.find(std::string(dependency));
        return it == breakers_.end() ? nullptr : it->second;
    }

    void CircuitBreakerRegistry::set_override(std::string dependency, BreakerConfig cfg) {
        std::lock_guard<std::mutex> lk(mu_);
        overrides_[std::move(dependency)] = cfg;
    }

    void CircuitBreakerRegistry::reset_all() {
        std::vector<std::shared_ptr<CircuitBreaker>> all;
        {
            std::lock_guard<std::mutex> lk(mu_);
            all.reserve(breakers_.size());
            for (const auto& kv : breakers_) all.push_back(kv.second);
        }
        for (const auto& b : all) b->reset();
    }

    std::vector<BreakerSnapshot> CircuitBreakerRegistry::snapshots() const {
        std::vector<std::shared_ptr<CircuitBreaker>> all;
        {
            std::lock_guard<std::mutex> lk(mu_);
            all.reserve(breakers_.size());
            for (const auto& kv : breakers_) all.push_back(kv.second);
        }
        std::vector<BreakerSnapshot> out;
        out.reserve(all.size());
        for (const auto& b : all) out.push_back(b->snapshot());
        return out;
    }

    std::size_t CircuitBreakerRegistry::size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return breakers_.size();
    }

} // namespace hearth::resilience
