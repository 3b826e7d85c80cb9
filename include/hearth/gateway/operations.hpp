#pragma once
/**
 * @file operations.hpp
 * @brief Closed set of gateway operations: one enum per interface, combined in a variant.
 * @details The (interface, operation) string pair is parsed once at the boundary; after
 *          that dispatch is a std::visit over statically typed handlers.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "hearth/compat/expected.hpp"

namespace hearth::gateway {

    enum class CacheOp : uint8_t { Get, Set, Exists, Delete, Clear, CleanupExpired, Maintain, GetMetadata, GetStats };
    enum class HttpOp : uint8_t { Request, Get, Post, Put, Delete, Patch, ConfigureRetry, GetStats, Reset };
    enum class WebSocketOp : uint8_t { Connect, Send, Receive, Close, Request, GetStats, Reset };
    enum class BreakerOp : uint8_t { GetState, GetAllStates, Reset, ResetAll };
    enum class SingletonOp : uint8_t { Exists, Delete, List, GetStats };
    enum class ConfigOp : uint8_t { Get };
    enum class LoggingOp : uint8_t { Info, Error };
    enum class MetricsOp : uint8_t { Record, Snapshot };

    /// Every operation the gateway can dispatch.
    using Operation = std::variant<CacheOp, HttpOp, WebSocketOp, BreakerOp, SingletonOp, ConfigOp, LoggingOp, MetricsOp>;

    /**
     * @brief Parse an (interface, operation) pair.
     * @return The operation, or a message naming the unknown interface/operation.
     */
    hearth_detail::expected<Operation, std::string> parse_operation(std::string_view interface,
                                                                    std::string_view operation);

    /// Interface name of @p op ("cache", "http_client", ...).
    std::string_view interface_name(const Operation& op) noexcept;

    /// Operation name of @p op ("get", "configure_retry", ...).
    std::string_view operation_name(const Operation& op) noexcept;

    /// Names of every interface.
    std::vector<std::string_view> interfaces();

    /// Operation names of @p interface (empty if unknown).
    std::vector<std::string_view> operations_of(std::string_view interface);

} // namespace hearth::gateway
