#pragma once
/**
 * @file circuit_breaker.hpp
 * @brief Per-dependency three-state failure-isolation guard and its lazy registry.
 *
 * State machine (one per dependency name):
 *
 *   CLOSED ──(consecutive_failures >= failure_threshold)──▶ OPEN
 *   OPEN   ──(recovery_timeout elapsed since opened_at)───▶ HALF_OPEN
 *   HALF_OPEN ──probe success──▶ CLOSED
 *   HALF_OPEN ──probe failure──▶ OPEN (opened_at reset)
 *
 * In HALF_OPEN at most `half_open_max_probes` probes are in flight; further callers are
 * rejected as if OPEN. The breaker is transport-agnostic: callers classify outcomes and
 * report them through record_success()/record_failure().
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "hearth/config/constants.hpp"
#include "hearth/core/clock.hpp"
#include "hearth/obs/observability.hpp"

namespace hearth::resilience {

    /** @enum BreakerState
     *  @brief Breaker status.
     */
    enum class BreakerState : uint8_t { Closed, Open, HalfOpen };

    /// "CLOSED" / "OPEN" / "HALF_OPEN".
    std::string_view to_string(BreakerState s) noexcept;

    /** @struct BreakerConfig
     *  @brief Thresholds and timers of one breaker.
     */
    struct BreakerConfig {
        uint32_t failure_threshold{hearth::config::constants::BREAKER_FAILURE_THRESHOLD};     ///< Failures to trip (1–20)
        uint32_t recovery_timeout_ms{hearth::config::constants::BREAKER_RECOVERY_TIMEOUT_MS}; ///< OPEN dwell (20–60 s)
        uint32_t half_open_max_probes{hearth::config::constants::BREAKER_HALF_OPEN_PROBES};   ///< Concurrent probes (1–2)
    };

    /** @enum Admission
     *  @brief Outcome of CircuitBreaker::try_acquire().
     */
    enum class Admission : uint8_t {
        Allowed,  ///< CLOSED: pass through
        Probe,    ///< HALF_OPEN: admitted as a recovery probe
        Rejected  ///< OPEN, or HALF_OPEN with every probe slot taken
    };

    /** @struct BreakerSnapshot
     *  @brief Point-in-time view of a breaker for diagnostics.
     */
    struct BreakerSnapshot {
        std::string  name;
        BreakerState state{BreakerState::Closed};
        uint32_t     consecutive_failures{0};
        uint32_t     probes_in_flight{0};
        std::optional<int64_t> open_for_ms;   ///< Time since opened_at, if OPEN/HALF_OPEN
        uint64_t     allowed{0}, rejected{0}, successes{0}, failures{0}, transitions{0};

        nlohmann::json to_json() const;
    };

    /** @class CircuitBreaker
     *  @brief One state machine per downstream dependency.
     */
    class CircuitBreaker {
    public:
        CircuitBreaker(std::string name, BreakerConfig cfg,
                       core::Clock& clock = core::steady_clock(),
                       std::shared_ptr<obs::EventLogger> log = obs::null_logger());

        CircuitBreaker(const CircuitBreaker&)            = delete;
        CircuitBreaker& operator=(const CircuitBreaker&) = delete;

        /// Gate a request. Every Allowed/Probe admission must be followed by one record_*() call.
        [[nodiscard]] Admission try_acquire();

        /// Report a successful call.
        void record_success();

        /// Report a failed call.
        void record_failure();

        /// Current state (applies the OPEN → HALF_OPEN timer transition first).
        [[nodiscard]] BreakerState state();

        /// Force CLOSED and clear counters (manual/operator reset).
        void reset();

        [[nodiscard]] BreakerSnapshot snapshot();

        [[nodiscard]] const std::string&   name() const noexcept { return name_; }
        [[nodiscard]] const BreakerConfig& config() const noexcept { return cfg_; }

    private:
        /// Time-driven transitions. Caller holds mu_.
        void refresh(core::Clock::time_point now);
        /// Move to @p next and log. Caller holds mu_.
        void transition(BreakerState next, core::Clock::time_point now);

        const std::string                 name_;
        const BreakerConfig               cfg_;
        core::Clock*                      clock_;
        std::shared_ptr<obs::EventLogger> log_;

        std::mutex   mu_;
        BreakerState state_{BreakerState::Closed};
        uint32_t     consecutive_failures_{0};
        std::optional<core::Clock::time_point> opened_at_;
        uint32_t     probes_in_flight_{0};
        core::Clock::time_point probe_started_at_{};

        uint64_t allowed_{0}, rejected_{0}, successes_{0}, failures_{0}, transitions_{0};
    };

    /** @class CircuitBreakerRegistry
     *  @brief Lazily creates one CircuitBreaker per dependency name.
     *  @details Breakers live as long as the registry (process lifetime in practice).
     */
    class CircuitBreakerRegistry {
    public:
        explicit CircuitBreakerRegistry(BreakerConfig defaults = {},
                                        core::Clock& clock = core::steady_clock(),
                                        std::shared_ptr<obs::EventLogger> log = obs::null_logger());

        /// Get or create the breaker for @p dependency (never null).
        [[nodiscard]] std::shared_ptr<CircuitBreaker> get(std::string_view dependency);

        /// Existing breaker only.
        [[nodiscard]] std::shared_ptr<CircuitBreaker> find(std::string_view dependency) const;

        /// Config used for breakers of @p dependency created after this call.
        void set_override(std::string dependency, BreakerConfig cfg);

        /// Reset every breaker to CLOSED.
        void reset_all();

        [[nodiscard]] std::vector<BreakerSnapshot> snapshots() const;
        [[nodiscard]] std::size_t size() const;

    private:
        BreakerConfig                     defaults_;
        core::Clock*                      clock_;
        std::shared_ptr<obs::EventLogger> log_;

        mutable std::mutex mu_;
        std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
        std::unordered_map<std::string, BreakerConfig>                   overrides_;
    };

} // namespace hearth::resilience
