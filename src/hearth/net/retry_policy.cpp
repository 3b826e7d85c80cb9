/**
 * @file retry_policy.cpp
 * @brief Retriable status set, geometric backoff schedule, validation and JSON form of RetryPolicy.
 */
#include "hearth/net/retry_policy.hpp"

#include <cmath>

namespace hearth::net {

    using namespace hearth::config::constants;

    std::set<int> default_retriable_statuses() {
        std::set<int> s{HTTP_STATUS_REQUEST_TIMEOUT, HTTP_STATUS_TOO_MANY_REQUESTS};
        for (int c = HTTP_STATUS_SERVER_ERROR_MIN; c <= HTTP_STATUS_SERVER_ERROR_MAX; ++c) s.insert(c);
        return s;
    }

    std::chrono::milliseconds RetryPolicy::backoff_delay(uint32_t attempt) const {
        const double ms = static_cast<double>(backoff_base_ms) *
                          std::pow(backoff_multiplier, static_cast<double>(attempt));
        return std::chrono::milliseconds(std::llround(ms));
    }

    std::chrono::milliseconds RetryPolicy::total_backoff() const {
        std::chrono::milliseconds total{0};
        for (uint32_t i = 0; i + 1 < max_attempts; ++i) total += backoff_delay(i);
        return total;
    }

    nlohmann::json RetryPolicy::to_json() const {
        return {{"max_attempts", max_attempts},
                {"backoff_base_ms", backoff_base_ms},
                {"backoff_multiplier", backoff_multiplier},
                {"retriable_status_codes", retriable_statuses},
                {"total_backoff_ms", total_backoff().count()}};
    }

    hearth_detail::expected<RetryPolicy, std::string> validate(RetryPolicy policy) {
        using Err = hearth_detail::unexpected<std::string>;
        if (policy.max_attempts < RETRY_MAX_ATTEMPTS_MIN || policy.max_attempts > RETRY_MAX_ATTEMPTS_MAX) {
            return Err("max_attempts must be in [1, 10], got " + std::to_string(policy.max_attempts));
        }
        if (policy.backoff_base_ms < RETRY_BACKOFF_BASE_MS_MIN || policy.backoff_base_ms > RETRY_BACKOFF_BASE_MS_MAX) {
            return Err("backoff_base_ms must be in [50, 1000], got " + std::to_string(policy.backoff_base_ms));
        }
        if (!(policy.backoff_multiplier >= RETRY_BACKOFF_MULTIPLIER_MIN &&
              policy.backoff_multiplier <= RETRY_BACKOFF_MULTIPLIER_MAX)) {
            return Err("backoff_multiplier must be in [1.0, 5.0], got " + std::to_string(policy.backoff_multiplier));
        }
        for (int code : policy.retriable_statuses) {
            if (code < 100 || code > 599) return Err("retriable_status_codes contains invalid status " + std::to_string(code));
        }
        return policy;
    }

    hearth_detail::expected<RetryPolicy, std::string> retry_policy_from_json(const nlohmann::json& j, RetryPolicy base) {
        using Err = hearth_detail::unexpected<std::string>;
        if (j.is_null()) return validate(std::move(base));
        if (!j.is_object()) return Err(std::string("retry policy must be a JSON object"));

        try {
            if (j.contains("max_attempts")) {
                const auto v = j.at("max_attempts").get<int64_t>();
                if (v < 0 || v > 1000) return Err("max_attempts must be in [1, 10], got " + std::to_string(v));
                base.max_attempts = static_cast<uint32_t>(v);
            }
            if (j.contains("backoff_base_ms")) {
                const auto v = j.at("backoff_base_ms").get<int64_t>();
                if (v < 0 || v > 1000000) return Err("backoff_base_ms must be in [50, 1000], got " + std::to_string(v));
                base.backoff_base_ms = static_cast<uint32_t>(v);
            }
            if (j.contains("backoff_multiplier")) base.backoff_multiplier = j.at("backoff_multiplier").get<double>();
            if (j.contains("retriable_status_codes")) {
                base.retriable_statuses = j.at("retriable_status_codes").get<std::set<int>>();
            }
        } catch (const nlohmann::json::exception& e) {
            return Err(std::string("retry policy: ") + e.what());
        }
        return validate(std::move(base));
    }

} // namespace hearth::net
