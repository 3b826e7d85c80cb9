#pragma once
/**
 * @file http_client.hpp
 * @brief Rate-limited, breaker-guarded, retrying HTTP client.
 *
 * Request pipeline (per call):
 *  1. validate method, URL and timeout                → Validation
 *  2. GET with cache_ttl > 0: read-through cache hit  → success, no I/O
 *  3. sliding-window limiter                          → RateLimit (never retried)
 *  4. breaker for "host:port" (or options.dependency) → CircuitOpen (no I/O)
 *  5. attempts: 2xx succeeds; retriable status or connection/timeout failure sleeps
 *     base * multiplier^attempt and retries; any other status is terminal (Upstream)
 *  6. attempts exhausted                              → RetryExhausted (+ attempts_used)
 *
 * The limiter and breaker are consulted once per request, not per attempt; every attempt
 * outcome is reported to the breaker.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "hearth/cache/ttl_cache.hpp"
#include "hearth/compat/expected.hpp"
#include "hearth/config/constants.hpp"
#include "hearth/core/clock.hpp"
#include "hearth/core/result.hpp"
#include "hearth/net/retry_policy.hpp"
#include "hearth/net/transport.hpp"
#include "hearth/obs/observability.hpp"
#include "hearth/resilience/circuit_breaker.hpp"
#include "hearth/resilience/rate_limiter.hpp"

namespace hearth::net {

    /** @struct HttpClientConfig
     *  @brief Construction-time settings of a RetryingHttpClient.
     */
    struct HttpClientConfig {
        RetryPolicy                   retry{};
        resilience::RateLimitConfig   rate{hearth::config::constants::RATE_LIMIT_HTTP_CEILING,
                                           hearth::config::constants::RATE_LIMIT_WINDOW_MS};
        std::chrono::milliseconds     timeout{hearth::config::constants::HTTP_TIMEOUT_MS}; ///< Per attempt
    };

    /** @struct RequestOptions
     *  @brief Per-call knobs. Defaults give a retried request with the client timeout.
     */
    struct RequestOptions {
        std::string               correlation_id;
        Headers                   headers;              ///< Merged over the default headers
        nlohmann::json            json_body = nullptr;  ///< Serialized as application/json when set
        std::chrono::milliseconds timeout{0};           ///< 0 selects the client default
        bool                      use_retry{true};      ///< false: exactly one attempt
        int32_t                   cache_ttl_s{0};       ///< GET only; > 0 enables read-through caching
        std::string               dependency;           ///< Breaker name override (default host:port)
    };

    /** @class RetryingHttpClient
     *  @brief One instance per process, owned by the SingletonRegistry.
     */
    class RetryingHttpClient {
    public:
        RetryingHttpClient(HttpClientConfig cfg,
                           std::shared_ptr<HttpTransport> transport,
                           std::shared_ptr<resilience::CircuitBreakerRegistry> breakers,
                           core::Clock& clock = core::steady_clock(),
                           std::shared_ptr<cache::TtlCache> cache = nullptr,
                           std::shared_ptr<obs::EventLogger> log = obs::null_logger(),
                           std::shared_ptr<obs::MetricsSink> metrics = nullptr);

        RetryingHttpClient(const RetryingHttpClient&)            = delete;
        RetryingHttpClient& operator=(const RetryingHttpClient&) = delete;

        /// Full pipeline for any of GET/POST/PUT/DELETE/PATCH (case-insensitive).
        core::OperationResult request(std::string_view method, std::string_view url,
                                      const RequestOptions& options = {});

        core::OperationResult get(std::string_view url, const RequestOptions& options = {}) {
            return request("GET", url, options);
        }
        core::OperationResult post(std::string_view url, const RequestOptions& options = {}) {
            return request("POST", url, options);
        }
        core::OperationResult put(std::string_view url, const RequestOptions& options = {}) {
            return request("PUT", url, options);
        }
        core::OperationResult del(std::string_view url, const RequestOptions& options = {}) {
            return request("DELETE", url, options);
        }
        core::OperationResult patch(std::string_view url, const RequestOptions& options = {}) {
            return request("PATCH", url, options);
        }

        /// Replace the retry policy wholesale after validation.
        hearth_detail::expected<void, std::string> configure_retry(RetryPolicy policy);

        [[nodiscard]] RetryPolicy retry_policy() const;

        struct Stats {
            uint64_t requests{0}, successful{0}, failed{0}, retries{0};
            uint64_t rate_limited{0}, circuit_rejected{0}, cache_hits{0};
            uint64_t total_backoff_ms{0};
        };
        [[nodiscard]] Stats stats() const noexcept;
        [[nodiscard]] nlohmann::json stats_json() const;

        /// Zero the counters and forget the limiter window.
        void reset();

    private:
        core::OperationResult fail(core::ErrorKind kind, std::string message, const std::string& cid,
                                   nlohmann::json details = nullptr);
        void count(std::string_view metric, double value = 1.0, std::string_view unit = "count");

        HttpClientConfig                                    cfg_;
        std::shared_ptr<HttpTransport>                      transport_;
        std::shared_ptr<resilience::CircuitBreakerRegistry> breakers_;
        core::Clock*                                        clock_;
        std::shared_ptr<cache::TtlCache>                    cache_;
        std::shared_ptr<obs::EventLogger>                   log_;
        std::shared_ptr<obs::MetricsSink>                   metrics_;
        resilience::SlidingWindowRateLimiter                limiter_;

        mutable std::mutex policy_mu_;
        RetryPolicy        policy_;

        std::atomic<uint64_t> requests_{0}, successful_{0}, failed_{0}, retries_{0};
        std::atomic<uint64_t> rate_limited_{0}, circuit_rejected_{0}, cache_hits_{0}, total_backoff_ms_{0};
    };

} // namespace hearth::net
