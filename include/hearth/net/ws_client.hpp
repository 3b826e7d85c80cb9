#pragma once
/**
 * @file ws_client.hpp
 * @brief Persistent-connection client: connect / send / receive / close over a bounded
 *        table of numbered connections, plus the one-shot request() composition.
 *
 * Admission mirrors the HTTP client: limiter first, then the breaker for "host:port".
 * Connect-phase transport failures are retried under the retry policy. Once a message has
 * been sent, a failure is terminal (the request may have been acted on), so request()
 * surfaces it directly. request() closes the connection exactly once on every path.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "hearth/config/constants.hpp"
#include "hearth/core/clock.hpp"
#include "hearth/core/result.hpp"
#include "hearth/net/retry_policy.hpp"
#include "hearth/net/transport.hpp"
#include "hearth/obs/observability.hpp"
#include "hearth/resilience/circuit_breaker.hpp"
#include "hearth/resilience/rate_limiter.hpp"

namespace hearth::net {

    /** @struct WsClientConfig
     *  @brief Construction-time settings of a WebSocketClient.
     */
    struct WsClientConfig {
        RetryPolicy                 retry{};
        resilience::RateLimitConfig rate{hearth::config::constants::RATE_LIMIT_WEBSOCKET_CEILING,
                                         hearth::config::constants::RATE_LIMIT_WINDOW_MS};
        uint32_t    default_timeout_s{hearth::config::constants::WEBSOCKET_TIMEOUT_S};
        std::size_t max_connections{hearth::config::constants::WEBSOCKET_MAX_OPEN_CONNECTIONS};
        std::size_t max_message_bytes{hearth::config::constants::WEBSOCKET_MAX_MESSAGE_BYTES};
        bool        allow_private_hosts{false};  ///< Permit loopback/private targets (local deployments)
    };

    /** @class WebSocketClient
     *  @brief One instance per process, owned by the SingletonRegistry.
     */
    class WebSocketClient {
    public:
        WebSocketClient(WsClientConfig cfg,
                        std::shared_ptr<WsConnector> connector,
                        std::shared_ptr<resilience::CircuitBreakerRegistry> breakers,
                        core::Clock& clock = core::steady_clock(),
                        std::shared_ptr<obs::EventLogger> log = obs::null_logger(),
                        std::shared_ptr<obs::MetricsSink> metrics = nullptr);

        ~WebSocketClient();

        WebSocketClient(const WebSocketClient&)            = delete;
        WebSocketClient& operator=(const WebSocketClient&) = delete;

        /// Open a connection. data: {connection_id, url, attempts_used}. timeout_s 0 = default.
        core::OperationResult connect(std::string_view url, uint32_t timeout_s = 0,
                                      const std::string& correlation_id = {});

        /// Send a JSON object (<= max_message_bytes serialized). data: {connection_id, bytes}.
        core::OperationResult send(uint64_t connection_id, const nlohmann::json& message,
                                   const std::string& correlation_id = {});

        /// Receive one message. data: {connection_id, message} (parsed JSON, else raw text).
        core::OperationResult receive(uint64_t connection_id, uint32_t timeout_s = 0,
                                      const std::string& correlation_id = {});

        /// Close and forget a connection. Never rate limited.
        core::OperationResult close(uint64_t connection_id, const std::string& correlation_id = {});

        /// connect → send → receive → close; close runs exactly once on every path.
        core::OperationResult request(std::string_view url, const nlohmann::json& message,
                                      uint32_t timeout_s = 0, const std::string& correlation_id = {});

        [[nodiscard]] std::size_t open_connections() const;
        [[nodiscard]] nlohmann::json stats_json() const;

        /// Close every open connection, zero counters and forget the limiter window.
        void reset();

    private:
        struct Connection {
            std::shared_ptr<WsConnection> conn;
            std::string                   url;
            std::string                   dependency;
            core::Clock::time_point       opened_at;
        };

        /// Validated URL and timeout for connect/request.
        struct Target {
            Url                       url;
            std::chrono::milliseconds timeout{0};
        };

        hearth_detail::expected<Target, std::string> validate_target(std::string_view url, uint32_t timeout_s) const;
        hearth_detail::expected<std::chrono::milliseconds, std::string> validate_timeout(uint32_t timeout_s) const;
        hearth_detail::expected<std::string, std::string> serialize(const nlohmann::json& message) const;

        /// Breaker-guarded connect with retries. On failure the error result is returned.
        hearth_detail::expected<std::unique_ptr<WsConnection>, core::OperationResult>
        open(const Target& target, std::shared_ptr<resilience::CircuitBreaker>& breaker,
             const std::string& cid, uint32_t& attempts_used);

        std::shared_ptr<WsConnection> lookup(uint64_t id) const;
        std::shared_ptr<WsConnection> detach(uint64_t id);
        core::OperationResult rate_limited(const std::string& cid);
        core::OperationResult fail(core::ErrorKind kind, std::string message, const std::string& cid,
                                   nlohmann::json details = nullptr);
        void count(std::string_view metric, double value = 1.0, std::string_view unit = "count");

        WsClientConfig                                      cfg_;
        std::shared_ptr<WsConnector>                        connector_;
        std::shared_ptr<resilience::CircuitBreakerRegistry> breakers_;
        core::Clock*                                        clock_;
        std::shared_ptr<obs::EventLogger>                   log_;
        std::shared_ptr<obs::MetricsSink>                   metrics_;
        resilience::SlidingWindowRateLimiter                limiter_;

        mutable std::mutex                   mu_;
        std::map<uint64_t, Connection>       connections_;
        uint64_t                             next_id_{1};

        std::atomic<uint64_t> connects_{0}, messages_sent_{0}, messages_received_{0}, closes_{0};
        std::atomic<uint64_t> requests_{0}, failed_{0}, retries_{0}, rate_limited_{0}, circuit_rejected_{0};
    };

} // namespace hearth::net
