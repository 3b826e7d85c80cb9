/**
 * @file operations.cpp
 * @brief Interface/operation name tables and their parsers.
 */
#include "hearth/gateway/operations.hpp"

#include <array>
#include <utility>

namespace hearth::gateway {

    namespace {

    template <class E, std::size_t N>
    using Table = std::array<std::pair<std::string_view, E>, N>;

    constexpr Table<CacheOp, 9> kCacheOps{{
        {"get", CacheOp::Get},
        {"set", CacheOp::Set},
        {"exists", CacheOp::Exists},
        {"delete", CacheOp::Delete},
        {"clear", CacheOp::Clear},
        {"cleanup_expired", CacheOp::CleanupExpired},
        {"maintain", CacheOp::Maintain},
        {"get_metadata", CacheOp::GetMetadata},
        {"get_stats", CacheOp::GetStats},
    }};

    constexpr Table<HttpOp, 9> kHttpOps{{
        {"request", HttpOp::Request},
        {"get", HttpOp::Get},
        {"post", HttpOp::Post},
        {"put", HttpOp::Put},
        {"delete", HttpOp::Delete},
        {"patch", HttpOp::Patch},
        {"configure_retry", HttpOp::ConfigureRetry},
        {"get_stats", HttpOp::GetStats},
        {"reset", HttpOp::Reset},
    }};

    constexpr Table<WebSocketOp, 7> kWebSocketOps{{
        {"connect", WebSocketOp::Connect},
        {"send", WebSocketOp::Send},
        {"receive", WebSocketOp::Receive},
        {"close", WebSocketOp::Close},
        {"request", WebSocketOp::Request},
        {"get_stats", WebSocketOp::GetStats},
        {"reset", WebSocketOp::Reset},
    }};

    constexpr Table<BreakerOp, 4> kBreakerOps{{
        {"get_state", BreakerOp::GetState},
        {"get_all_states", BreakerOp::GetAllStates},
        {"reset", BreakerOp::Reset},
        {"reset_all", BreakerOp::ResetAll},
    }};

    constexpr Table<SingletonOp, 4> kSingletonOps{{
        {"exists", SingletonOp::Exists},
        {"delete", SingletonOp::Delete},
        {"list", SingletonOp::List},
        {"get_stats", SingletonOp::GetStats},
    }};

    constexpr Table<ConfigOp, 1> kConfigOps{{{"get", ConfigOp::Get}}};

    constexpr Table<LoggingOp, 2> kLoggingOps{{{"info", LoggingOp::Info}, {"error", LoggingOp::Error}}};

    constexpr Table<MetricsOp, 2> kMetricsOps{{{"record", MetricsOp::Record}, {"snapshot", MetricsOp::Snapshot}}};

    template <class E, std::size_t N>
    hearth_detail::expected<Operation, std::string> find_op(const Table<E, N>& table, std::string_view interface,
                                                            std::string_view operation) {
        for (const auto& [name, op] : table) {
            if (name == operation) return Operation{op};
        }
        return hearth_detail::unexpected<std::string>("unknown operation '" + std::string(operation) +
                                                      "' for interface '" + std::string(interface) + "'");
    }

    template <class E, std::size_t N>
    std::string_view name_of(const Table<E, N>& table, E op) noexcept {
        for (const auto& [name, e] : table) {
            if (e == op) return name;
        }
        return "unknown";
    }

    template <class E, std::size_t N>
    std::vector<std::string_view> names_of(const Table<E, N>& table) {
        std::vector<std::string_view> out;
        out.reserve(N);
        for (const auto& entry : table) out.push_back(entry.first);
        return out;
    }

    template <class... Ts>
    struct overloaded : Ts... { using Ts::operator()...; };
    template <class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    } // namespace

    hearth_detail::expected<Operation, std::string> parse_operation(std::string_view interface,
                                                                    std::string_view operation) {
        if (interface == "cache")           return find_op(kCacheOps, interface, operation);
        if (interface == "http_client")     return find_op(kHttpOps, interface, operation);
        if (interface == "websocket")       return find_op(kWebSocketOps, interface, operation);
        if (interface == "circuit_breaker") return find_op(kBreakerOps, interface, operation);
        if (interface == "singleton")       return find_op(kSingletonOps, interface, operation);
        if (interface == "config")          return find_op(kConfigOps, interface, operation);
        if (interface == "logging")         return find_op(kLoggingOps, interface, operation);
        if (interface == "metrics")         return find_op(kMetricsOps, interface, operation);
        return hearth_detail::unexpected<std::string>("unknown interface '" + std::string(interface) + "'");
    }

    std::string_view interface_name(const Operation& op) noexcept {
        return std::visit(overloaded{
                              [](CacheOp) { return std::string_view{"cache"}; },
                              [](HttpOp) { return std::string_view{"http_client"}; },
                              [](WebSocketOp) { return std::string_view{"websocket"}; },
                              [](BreakerOp) { return std::string_view{"circuit_breaker"}; },
                              [](SingletonOp) { return std::string_view{"singleton"}; },
                              [](ConfigOp) { return std::string_view{"config"}; },
                              [](LoggingOp) { return std::string_view{"logging"}; },
                              [](MetricsOp) { return std::string_view{"metrics"}; },
                          },
                          op);
    }

    std::string_view operation_name(const Operation& op) noexcept {
        return std::visit(overloaded{
                              [](CacheOp o) { return name_of(kCacheOps, o); },
                              [](HttpOp o) { return name_of(kHttpOps, o); },
                              [](WebSocketOp o) { return name_of(kWebSocketOps, o); },
                              [](BreakerOp o) { return name_of(kBreakerOps, o); },
                              [](SingletonOp o) { return name_of(kSingletonOps, o); },
                              [](ConfigOp o) { return name_of(kConfigOps, o); },
                              [](LoggingOp o) { return name_of(kLoggingOps, o); },
                              [](MetricsOp o) { return name_of(kMetricsOps, o); },
                          },
                          op);
    }

    std::vector<std::string_view> interfaces() {
        return {"cache", "http_client", "websocket", "circuit_breaker", "singleton", "config", "logging", "metrics"};
    }

    std::vector<std::string_view> operations_of(std::string_view interface) {
        if (interface == "cache")           return names_of(kCacheOps);
        if (interface == "http_client")     return names_of(kHttpOps);
        if (interface == "websocket")       return names_of(kWebSocketOps);
        if (interface == "circuit_breaker") return names_of(kBreakerOps);
        if (interface == "singleton")       return names_of(kSingletonOps);
        if (interface == "config")          return names_of(kConfigOps);
        if (interface == "logging")         return names_of(kLoggingOps);
        if (interface == "metrics")         return names_of(kMetricsOps);
        return {};
    }

} // namespace hearth::gateway
