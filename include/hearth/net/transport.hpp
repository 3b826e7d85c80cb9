#pragma once
/**
 * @file transport.hpp
 * @brief Transport seams used by the retrying clients.
 * @details Implementations perform one blocking exchange bounded by the supplied timeout
 *          and report failures as TransportError values (never exceptions). The clients own
 *          retry, breaker and rate-limit policy; transports only move bytes.
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include "hearth/compat/expected.hpp"
#include "hearth/net/url.hpp"

namespace hearth::net {

    /// Failure classes a transport can report.
    enum class TransportErrc : uint8_t {
        Connection,  ///< Resolve, connect, TLS handshake, reset or closed by peer
        Timeout,     ///< Deadline expired before the stage completed
        Protocol     ///< Peer spoke something unparseable
    };

    std::string_view to_string(TransportErrc e) noexcept;

    struct TransportError {
        TransportErrc code{TransportErrc::Connection};
        std::string   message;
    };

    /// Case-insensitive ordering for header names.
    struct HeaderLess {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept;
    };

    using Headers = std::map<std::string, std::string, HeaderLess>;

    struct HttpRequest {
        std::string               method;  ///< Upper-case verb
        Url                       url;
        Headers                   headers;
        std::string               body;
        std::chrono::milliseconds timeout{0};
    };

    struct HttpResponse {
        int         status{0};
        Headers     headers;
        std::string body;
    };

    /** @class HttpTransport
     *  @brief One request/response exchange per call.
     */
    class HttpTransport {
    public:
        virtual ~HttpTransport() = default;
        virtual hearth_detail::expected<HttpResponse, TransportError> send(const HttpRequest& request) = 0;
    };

    /** @class WsConnection
     *  @brief An open WebSocket. close() is idempotent and never throws.
     */
    class WsConnection {
    public:
        virtual ~WsConnection() = default;
        virtual hearth_detail::expected<void, TransportError> send_text(std::string_view text,
                                                                        std::chrono::milliseconds timeout) = 0;
        virtual hearth_detail::expected<std::string, TransportError> receive_text(std::chrono::milliseconds timeout) = 0;
        virtual void close() noexcept = 0;
    };

    /** @class WsConnector
     *  @brief Opens WebSocket connections (TCP + optional TLS + upgrade handshake).
     */
    class WsConnector {
    public:
        virtual ~WsConnector() = default;
        virtual hearth_detail::expected<std::unique_ptr<WsConnection>, TransportError>
        connect(const Url& url, std::chrono::milliseconds timeout) = 0;
    };

} // namespace hearth::net
