#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults and accepted ranges for runtime components.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (JSON) in production deployments.
 */

#include <cstddef>
#include <cstdint>

namespace hearth::config::constants {

// =====================
// Retry policy
// Units: milliseconds for delays; attempts count the first try.
// =====================
inline constexpr uint32_t RETRY_MAX_ATTEMPTS          = 3;    ///< Default attempts per request
inline constexpr uint32_t RETRY_MAX_ATTEMPTS_MIN      = 1;
inline constexpr uint32_t RETRY_MAX_ATTEMPTS_MAX      = 10;
inline constexpr uint32_t RETRY_BACKOFF_BASE_MS       = 100;  ///< First backoff delay
inline constexpr uint32_t RETRY_BACKOFF_BASE_MS_MIN   = 50;
inline constexpr uint32_t RETRY_BACKOFF_BASE_MS_MAX   = 1000;
inline constexpr double   RETRY_BACKOFF_MULTIPLIER     = 2.0;  ///< Geometric growth per attempt
inline constexpr double   RETRY_BACKOFF_MULTIPLIER_MIN = 1.0;
inline constexpr double   RETRY_BACKOFF_MULTIPLIER_MAX = 5.0;

// Retriable HTTP status codes: request-timeout, too-many-requests, and the 5xx class.
inline constexpr int HTTP_STATUS_REQUEST_TIMEOUT   = 408;
inline constexpr int HTTP_STATUS_TOO_MANY_REQUESTS = 429;
inline constexpr int HTTP_STATUS_SERVER_ERROR_MIN  = 500;
inline constexpr int HTTP_STATUS_SERVER_ERROR_MAX  = 599;

// =====================
// Sliding-window rate limiting
// =====================
inline constexpr uint32_t RATE_LIMIT_WINDOW_MS         = 1000; ///< Trailing window length
inline constexpr uint32_t RATE_LIMIT_HTTP_CEILING      = 500;  ///< HTTP client ops per window
inline constexpr uint32_t RATE_LIMIT_WEBSOCKET_CEILING = 300;  ///< WebSocket client ops per window
inline constexpr uint32_t RATE_LIMIT_CEILING_MAX       = 10000;

// =====================
// Circuit breaker
// =====================
inline constexpr uint32_t BREAKER_FAILURE_THRESHOLD      = 5;
inline constexpr uint32_t BREAKER_FAILURE_THRESHOLD_MIN  = 1;
inline constexpr uint32_t BREAKER_FAILURE_THRESHOLD_MAX  = 20;
inline constexpr uint32_t BREAKER_RECOVERY_TIMEOUT_MS     = 45000; ///< OPEN dwell before probing
inline constexpr uint32_t BREAKER_RECOVERY_TIMEOUT_MS_MIN = 20000;
inline constexpr uint32_t BREAKER_RECOVERY_TIMEOUT_MS_MAX = 60000;
inline constexpr uint32_t BREAKER_HALF_OPEN_PROBES        = 1;
inline constexpr uint32_t BREAKER_HALF_OPEN_PROBES_MAX    = 2;

// =====================
// Cache
// Units: seconds for TTL; bytes for budgets; fraction (0.0–1.0) for pressure.
// =====================
inline constexpr int32_t     CACHE_DEFAULT_TTL_S   = 300;               ///< 5 minutes
inline constexpr int32_t     CACHE_MAX_TTL_S       = 3600;              ///< 1 hour
inline constexpr std::size_t CACHE_MAX_BYTES       = 16u * 1024u * 1024u; ///< 16 MiB estimate budget
inline constexpr std::size_t CACHE_ENTRY_OVERHEAD  = 96;                ///< Per-entry bookkeeping estimate

inline constexpr double CACHE_PRESSURE_CLEANUP   = 0.75; ///< Purge expired entries
inline constexpr double CACHE_PRESSURE_EVICT     = 0.85; ///< LRU eviction down to CLEANUP mark
inline constexpr double CACHE_PRESSURE_CRITICAL  = 0.95; ///< LRU eviction down to CRITICAL_TARGET
inline constexpr double CACHE_PRESSURE_EMERGENCY = 0.98; ///< Clear everything
inline constexpr double CACHE_CRITICAL_TARGET    = 0.50;
inline constexpr double CACHE_PRESSURE_MARK_MIN  = 0.01; ///< Lowest configurable mark or target

inline constexpr std::size_t HOST_MEMORY_LIMIT_MB = 128; ///< Host process ceiling for the memory gauge

// =====================
// Transports
// =====================
inline constexpr uint32_t HTTP_TIMEOUT_MS          = 30000; ///< Per-attempt deadline
inline constexpr uint32_t HTTP_TIMEOUT_MS_MAX      = 60000;
inline constexpr uint32_t WEBSOCKET_TIMEOUT_S      = 10;
inline constexpr uint32_t WEBSOCKET_TIMEOUT_S_MIN  = 1;
inline constexpr uint32_t WEBSOCKET_TIMEOUT_S_MAX  = 60;
inline constexpr std::size_t WEBSOCKET_MAX_MESSAGE_BYTES = 1024u * 1024u; ///< 1 MiB
inline constexpr std::size_t WEBSOCKET_URL_MIN_LEN = 10;
inline constexpr std::size_t WEBSOCKET_URL_MAX_LEN = 500;
inline constexpr std::size_t WEBSOCKET_MAX_OPEN_CONNECTIONS = 8;
inline constexpr uint32_t WEBSOCKET_CLOSE_TIMEOUT_MS = 1000; ///< Bound on the close handshake

} // namespace hearth::config::constants
