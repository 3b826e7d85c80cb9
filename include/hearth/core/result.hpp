#pragma once
/**
 * @file result.hpp
 * @brief OperationResult: the complete, never partially populated outcome of every
 *        public operation, plus the error taxonomy surfaced to callers.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace hearth::core {

    /**
     * @enum ErrorKind
     * @brief Failure classes reported in OperationResult::error_kind.
     * @note A cache miss is not an error; it is a successful result with `hit == false`.
     */
    enum class ErrorKind : uint8_t {
        None = 0,        ///< Success
        Validation,      ///< Bad input to an API (out-of-range config, malformed URL, ...)
        RateLimit,       ///< Admission rejected locally; never retried
        CircuitOpen,     ///< Admission rejected by breaker state; no I/O attempted
        Connection,      ///< Transport-level failure (resolve/connect/handshake/reset)
        Timeout,         ///< Deadline expired during an attempt
        RetryExhausted,  ///< Every attempt consumed without success
        Dispatch,        ///< Unknown interface/operation at the gateway
        Upstream,        ///< Remote answered with a terminal (non-retriable) status
        NotFound,        ///< Unknown connection id or component name
        Internal         ///< Unexpected exception converted at the gateway boundary
    };

    /// Stable name of an ErrorKind (e.g. "CircuitOpenError"); "" for None.
    std::string_view to_string(ErrorKind kind) noexcept;

    /**
     * @struct OperationResult
     * @brief Outcome of a gateway/component operation.
     */
    struct OperationResult {
        bool           success{false};          ///< Definite success/failure signal
        nlohmann::json data;                    ///< Payload (success) or failure details (may be null)
        std::string    error;                   ///< Human-readable message (failure only)
        ErrorKind      error_kind{ErrorKind::None};
        std::string    correlation_id;          ///< Propagated or generated id

        /// Build a success result.
        static OperationResult ok(nlohmann::json data, std::string correlation_id = {});

        /// Build a failure result; @p details lands in `data`.
        static OperationResult failure(ErrorKind kind, std::string message,
                                       std::string correlation_id = {},
                                       nlohmann::json details = nullptr);

        /// Wire form: {success, data?, error?, error_kind?, correlation_id?}.
        nlohmann::json to_json() const;
    };

} // namespace hearth::core
