#pragma once
/**
 * @file beast_transport.hpp
 * @brief Boost.Beast implementations of HttpTransport and WsConnector (plain or TLS).
 * @details Each call owns a private io_context and drives it until the started operation
 *          completes. Stream operations are bounded by beast::tcp_stream expiry; name
 *          resolution is bounded by io_context::run_until followed by cancellation.
 */

#include <memory>
#include <string>

#include <boost/asio/ssl/context.hpp>

#include "hearth/net/transport.hpp"

namespace hearth::net {

    /** @struct TlsOptions
     *  @brief Client-side TLS verification settings.
     */
    struct TlsOptions {
        bool        verify_peer{true};  ///< Verify certificate chain and host name
        std::string ca_file;            ///< Extra CA bundle (PEM); empty uses system paths
    };

    /** @class BeastHttpTransport
     *  @brief HTTP/1.1 over TCP or TLS; one connection per request.
     */
    class BeastHttpTransport final : public HttpTransport {
    public:
        /// @throws boost::system::system_error if the TLS context cannot be initialised.
        explicit BeastHttpTransport(TlsOptions tls = {});

        hearth_detail::expected<HttpResponse, TransportError> send(const HttpRequest& request) override;

    private:
        boost::asio::ssl::context ssl_ctx_;
        TlsOptions                tls_;
    };

    /** @class BeastWsConnector
     *  @brief RFC 6455 client connections over TCP or TLS.
     */
    class BeastWsConnector final : public WsConnector {
    public:
        /// @throws boost::system::system_error if the TLS context cannot be initialised.
        explicit BeastWsConnector(TlsOptions tls = {});

        hearth_detail::expected<std::unique_ptr<WsConnection>, TransportError>
        connect(const Url& url, std::chrono::milliseconds timeout) override;

    private:
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;  ///< Shared with open TLS connections
        TlsOptions                                 tls_;
    };

} // namespace hearth::net
