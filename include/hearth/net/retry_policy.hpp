#pragma once
/**
 * @file retry_policy.hpp
 * @brief Immutable retry policy: attempt budget, deterministic geometric backoff and the
 *        set of HTTP statuses that count as transient.
 * @details Delay after attempt i (0-based) is `backoff_base_ms * backoff_multiplier^i`.
 *          No jitter, so the worst-case added latency is known up front (total_backoff()).
 */

#include <chrono>
#include <cstdint>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

#include "hearth/compat/expected.hpp"
#include "hearth/config/constants.hpp"

namespace hearth::net {

    /// {408, 429, 500..599}.
    std::set<int> default_retriable_statuses();

    /** @struct RetryPolicy
     *  @brief Replaced wholesale by reconfiguration, never mutated in place.
     */
    struct RetryPolicy {
        uint32_t      max_attempts{hearth::config::constants::RETRY_MAX_ATTEMPTS};       ///< Includes the first try
        uint32_t      backoff_base_ms{hearth::config::constants::RETRY_BACKOFF_BASE_MS};
        double        backoff_multiplier{hearth::config::constants::RETRY_BACKOFF_MULTIPLIER};
        std::set<int> retriable_statuses{default_retriable_statuses()};

        /// Delay to wait after failed attempt @p attempt (0-based).
        [[nodiscard]] std::chrono::milliseconds backoff_delay(uint32_t attempt) const;

        /// Sum of every delay a fully exhausted request would sleep.
        [[nodiscard]] std::chrono::milliseconds total_backoff() const;

        [[nodiscard]] bool is_retriable_status(int status) const { return retriable_statuses.count(status) != 0; }

        [[nodiscard]] nlohmann::json to_json() const;
    };

    /// Range-check every field; the error names the offending key.
    hearth_detail::expected<RetryPolicy, std::string> validate(RetryPolicy policy);

    /**
     * @brief Overlay keys of @p j (max_attempts, backoff_base_ms, backoff_multiplier,
     *        retriable_status_codes) onto @p base and validate the result.
     */
    hearth_detail::expected<RetryPolicy, std::string> retry_policy_from_json(const nlohmann::json& j,
                                                                             RetryPolicy base = {});

} // namespace hearth::net
