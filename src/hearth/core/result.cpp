/**
 * @file result.cpp
 * @brief OperationResult builders and wire serialisation.
 */
#include "hearth/core/result.hpp"

#include <utility>

namespace hearth::core {

    std::string_view to_string(ErrorKind kind) noexcept {
        switch (kind) {
            case ErrorKind::None:           return "";
            case ErrorKind::Validation:     return "ValidationError";
            case ErrorKind::RateLimit:      return "RateLimitError";
            case ErrorKind::CircuitOpen:    return "CircuitOpenError";
            case ErrorKind::Connection:     return "ConnectionError";
            case ErrorKind::Timeout:        return "TimeoutError";
            case ErrorKind::RetryExhausted: return "RetryExhaustedError";
            case ErrorKind::Dispatch:       return "DispatchError";
            case ErrorKind::Upstream:       return "UpstreamError";
            case ErrorKind::NotFound:       return "NotFoundError";
            case ErrorKind::Internal:       return "InternalError";
        }
        return "InternalError";
    }

    OperationResult OperationResult::ok(nlohmann::json data, std::string correlation_id) {
        OperationResult r;
        r.success = true;
        r.data = std::move(data);
        r.correlation_id = std::move(correlation_id);
        return r;
    }

    OperationResult OperationResult::failure(ErrorKind kind, std::string message,
                                             std::string correlation_id,
                                             nlohmann::json details) {
        OperationResult r;
        r.success = false;
        r.error_kind = (kind == ErrorKind::None) ? ErrorKind::Internal : kind;
        r.error = std::move(message);
        r.data = std::move(details);
        r.correlation_id = std::move(correlation_id);
        return r;
    }

    nlohmann::json OperationResult::to_json() const {
        nlohmann::json out = {{"success", success}};
        if (!data.is_null()) out["data"] = data;
        if (!success) {
            out["error"] = error;
            out["error_kind"] = std::string(to_string(error_kind));
        }
        if (!correlation_id.empty()) out["correlation_id"] = correlation_id;
        return out;
    }

} // namespace hearth::core
