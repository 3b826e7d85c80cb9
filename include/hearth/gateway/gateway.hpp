#pragma once
/**
 * @file gateway.hpp
 * @brief Single entry point: execute(interface, operation, kwargs) → OperationResult.
 *
 * The gateway parses the string pair into an Operation, resolves the component through the
 * SingletonRegistry (constructing it lazily on first use), invokes it and returns a complete
 * result. It owns correlation-id propagation, per-call logging/metrics and call counters.
 * Nothing throws across execute(): unknown operations are Dispatch results and unexpected
 * exceptions become Internal results.
 */

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "hearth/cache/ttl_cache.hpp"
#include "hearth/compat/expected.hpp"
#include "hearth/config/config_loader.hpp"
#include "hearth/core/clock.hpp"
#include "hearth/core/result.hpp"
#include "hearth/core/singleton_registry.hpp"
#include "hearth/gateway/operations.hpp"
#include "hearth/net/http_client.hpp"
#include "hearth/net/transport.hpp"
#include "hearth/net/ws_client.hpp"
#include "hearth/obs/observability.hpp"
#include "hearth/os/memory_gauge.hpp"
#include "hearth/resilience/circuit_breaker.hpp"

namespace hearth::gateway {

    /// Registry names of the lazily constructed components.
    /// http_client holds circuit_breakers and cache; websocket holds circuit_breakers. Deleting a
    /// dependency through `singleton.delete` also deletes its holders so that one instance per
    /// name stays authoritative.
    namespace component {
    inline constexpr std::string_view kCircuitBreakers = "circuit_breakers";
    inline constexpr std::string_view kCache           = "cache";
    inline constexpr std::string_view kHttpClient      = "http_client";
    inline constexpr std::string_view kWebSocket       = "websocket";
    inline constexpr std::string_view kConfig          = "config";
    } // namespace component

    /** @struct GatewayOptions
     *  @brief Collaborators and factories the gateway wires into components.
     *  @note Empty transport factories select the Boost.Beast implementations. A null memory
     *        gauge selects ProcessMemoryGauge when runtime.host_memory_limit_mb > 0.
     */
    struct GatewayOptions {
        config::RuntimeConfig                               runtime = config::Loader::defaults();
        std::shared_ptr<obs::EventLogger>                   logger = obs::default_logger();
        std::shared_ptr<obs::InMemoryMetrics>               metrics = std::make_shared<obs::InMemoryMetrics>();
        core::Clock*                                        clock = &core::steady_clock();
        std::function<std::shared_ptr<net::HttpTransport>()> http_transport;
        std::function<std::shared_ptr<net::WsConnector>()>   ws_connector;
        std::shared_ptr<os::MemoryGauge>                    memory_gauge;
    };

    /** @class Gateway
     *  @brief Dispatcher over the closed Operation set.
     */
    class Gateway {
    public:
        explicit Gateway(core::SingletonRegistry& registry, GatewayOptions options = {});

        Gateway(const Gateway&)            = delete;
        Gateway& operator=(const Gateway&) = delete;

        /**
         * @brief Run one operation.
         * @param kwargs JSON object of arguments; "correlation_id" is propagated when present.
         */
        core::OperationResult execute(std::string_view interface, std::string_view operation,
                                      const nlohmann::json& kwargs = nlohmann::json::object());

        /// Call counters: {"total", "dispatch_errors", "operations": {"iface.op": n}}.
        [[nodiscard]] nlohmann::json stats() const;

    private:
        // Component resolution through the registry.
        hearth_detail::expected<std::shared_ptr<resilience::CircuitBreakerRegistry>, core::RegistryErr> breakers();
        hearth_detail::expected<std::shared_ptr<cache::TtlCache>, core::RegistryErr> ttl_cache();
        hearth_detail::expected<std::shared_ptr<net::RetryingHttpClient>, core::RegistryErr> http_client();
        hearth_detail::expected<std::shared_ptr<net::WebSocketClient>, core::RegistryErr> websocket();
        hearth_detail::expected<std::shared_ptr<config::ConfigProvider>, core::RegistryErr> config_provider();

        // One handler per interface.
        core::OperationResult handle(CacheOp op, const nlohmann::json& kw, const std::string& cid);
        core::OperationResult handle(HttpOp op, const nlohmann::json& kw, const std::string& cid);
        core::OperationResult handle(WebSocketOp op, const nlohmann::json& kw, const std::string& cid);
        core::OperationResult handle(BreakerOp op, const nlohmann::json& kw, const std::string& cid);
        core::OperationResult handle(SingletonOp op, const nlohmann::json& kw, const std::string& cid);
        core::OperationResult handle(ConfigOp op, const nlohmann::json& kw, const std::string& cid);
        core::OperationResult handle(LoggingOp op, const nlohmann::json& kw, const std::string& cid);
        core::OperationResult handle(MetricsOp op, const nlohmann::json& kw, const std::string& cid);

        std::string correlation_id(const nlohmann::json& kwargs);
        void count_call(const Operation& op);

        core::SingletonRegistry&              registry_;
        GatewayOptions                        opts_;
        core::Clock*                          clock_;
        std::shared_ptr<obs::EventLogger>     log_;
        std::shared_ptr<obs::InMemoryMetrics> metrics_;

        mutable std::mutex              mu_;
        std::mt19937_64                 rng_;
        uint64_t                        total_calls_{0};
        uint64_t                        dispatch_errors_{0};
        std::map<std::string, uint64_t> calls_;   ///< "interface.operation" → count
    };

} // namespace hearth::gateway
