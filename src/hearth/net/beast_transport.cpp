/**
 * @file beast_transport.cpp
 * @brief Blocking-with-deadline HTTP and WebSocket clients on Boost.Beast.
 */
#include "hearth/net/beast_transport.hpp"

#include <chrono>
#include <string_view>
#include <type_traits>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>

#include "hearth/config/constants.hpp"
#include "hearth/version.hpp"

namespace hearth::net {

    namespace asio      = boost::asio;
    namespace beast     = boost::beast;
    namespace http      = beast::http;
    namespace websocket = beast::websocket;
    using tcp           = asio::ip::tcp;
    using Deadline      = std::chrono::steady_clock::time_point;

    namespace {

    using Err = hearth_detail::unexpected<TransportError>;

    TransportError make_error(const beast::error_code& ec, std::string_view stage) {
        TransportErrc code = TransportErrc::Connection;
        if (ec == beast::error::timeout || ec == asio::error::timed_out || ec == asio::error::operation_aborted) {
            code = TransportErrc::Timeout;
        } else if (ec.category() == http::make_error_code(http::error::bad_version).category() &&
                   ec != http::error::end_of_stream) {
            code = TransportErrc::Protocol;
        }
        return TransportError{code, std::string(stage) + ": " + ec.message()};
    }

    /// Start one async operation and drive @p ioc until its handler has run.
    /// The stream expiry set by the caller bounds the operation.
    template <class Start>
    beast::error_code run_op(asio::io_context& ioc, Start&& start) {
        beast::error_code result = asio::error::would_block;
        std::forward<Start>(start)([&result](beast::error_code ec, auto&&...) { result = ec; });
        ioc.restart();
        ioc.run();
        return result;
    }

    hearth_detail::expected<tcp::resolver::results_type, TransportError>
    resolve(asio::io_context& ioc, const Url& url, Deadline deadline) {
        tcp::resolver resolver(ioc);
        tcp::resolver::results_type results;
        beast::error_code result = asio::error::would_block;
        resolver.async_resolve(url.host, std::to_string(url.port),
                               [&](beast::error_code ec, tcp::resolver::results_type r) {
                                   result = ec;
                                   results = std::move(r);
                               });
        ioc.restart();
        ioc.run_until(deadline);
        if (result == asio::error::would_block) {
            resolver.cancel();
            ioc.restart();
            ioc.run();
            return Err(TransportError{TransportErrc::Timeout, "resolve " + url.host + ": timed out"});
        }
        if (result) return Err(make_error(result, "resolve " + url.host));
        return results;
    }

    void init_tls(asio::ssl::context& ctx, const TlsOptions& tls) {
        ctx.set_default_verify_paths();
        if (!tls.ca_file.empty()) ctx.load_verify_file(tls.ca_file);
        ctx.set_verify_mode(tls.verify_peer ? asio::ssl::verify_peer : asio::ssl::verify_none);
    }

    /// SNI + host name verification on a TLS stream before its handshake.
    template <class SslStream>
    hearth_detail::expected<void, TransportError> prepare_tls(SslStream& stream, const Url& url, const TlsOptions& tls) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            return Err(TransportError{TransportErrc::Connection, "tls: cannot set SNI host name"});
        }
        if (tls.verify_peer) stream.set_verify_callback(asio::ssl::host_name_verification(url.host));
        return {};
    }

    template <class Stream>
    hearth_detail::expected<HttpResponse, TransportError>
    exchange(asio::io_context& ioc, Stream& stream, const HttpRequest& request, Deadline deadline) {
        http::request<http::string_body> req;
        req.method_string(request.method);
        req.target(request.url.target);
        req.version(11);
        req.set(http::field::host, request.url.host_header());
        for (const auto& [name, value] : request.headers) req.set(name, value);
        req.body() = request.body;
        req.prepare_payload();

        beast::get_lowest_layer(stream).expires_at(deadline);
        if (auto ec = run_op(ioc, [&](auto h) { http::async_write(stream, req, std::move(h)); }); ec) {
            return Err(make_error(ec, "write"));
        }

        beast::flat_buffer                 buffer;
        http::response<http::string_body> res;
        if (auto ec = run_op(ioc, [&](auto h) { http::async_read(stream, buffer, res, std::move(h)); }); ec) {
            return Err(make_error(ec, "read"));
        }

        HttpResponse out;
        out.status = static_cast<int>(res.result_int());
        for (const auto& field : res) {
            out.headers.insert_or_assign(std::string(field.name_string()), std::string(field.value()));
        }
        out.body = std::move(res.body());
        return out;
    }

    Deadline deadline_after(std::chrono::milliseconds timeout) {
        if (timeout.count() <= 0) timeout = std::chrono::milliseconds(hearth::config::constants::HTTP_TIMEOUT_MS);
        return std::chrono::steady_clock::now() + timeout;
    }

    // ---------------------------------------------------------------------------
    // WebSocket connection over NextLayer (tcp_stream or ssl_stream<tcp_stream>)
    // ---------------------------------------------------------------------------

    template <class NextLayer>
    class BeastWsConnection final : public WsConnection {
        static constexpr bool kTls = !std::is_same_v<NextLayer, beast::tcp_stream>;

    public:
        template <class... Args>
        explicit BeastWsConnection(std::shared_ptr<asio::ssl::context> ssl_ctx, Args&&... args)
            : ssl_ctx_(std::move(ssl_ctx)), ws_(ioc_, std::forward<Args>(args)...) {}

        ~BeastWsConnection() override { close(); }

        hearth_detail::expected<void, TransportError> open(const Url& url, Deadline deadline, const TlsOptions& tls) {
            auto endpoints = resolve(ioc_, url, deadline);
            if (!endpoints) return Err(endpoints.error());

            auto& tcp_layer = beast::get_lowest_layer(ws_);
            tcp_layer.expires_at(deadline);
            if (auto ec = run_op(ioc_, [&](auto h) { tcp_layer.async_connect(*endpoints, std::move(h)); }); ec) {
                return Err(make_error(ec, "connect"));
            }

            if constexpr (kTls) {
                if (auto ok = prepare_tls(ws_.next_layer(), url, tls); !ok) return Err(ok.error());
                if (auto ec = run_op(ioc_, [&](auto h) {
                        ws_.next_layer().async_handshake(asio::ssl::stream_base::client, std::move(h));
                    });
                    ec) {
                    return Err(make_error(ec, "tls handshake"));
                }
            }

            ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
                req.set(http::field::user_agent, hearth::user_agent);
            }));
            if (auto ec = run_op(ioc_, [&](auto h) {
                    ws_.async_handshake(url.host_header(), url.target, std::move(h));
                });
                ec) {
                return Err(make_error(ec, "websocket handshake"));
            }
            tcp_layer.expires_never();
            ws_.text(true);
            return {};
        }

        hearth_detail::expected<void, TransportError> send_text(std::string_view text,
                                                                std::chrono::milliseconds timeout) override {
            if (closed_) return Err(TransportError{TransportErrc::Connection, "send: connection closed"});
            beast::get_lowest_layer(ws_).expires_after(timeout);
            const auto ec = run_op(ioc_, [&](auto h) {
                ws_.async_write(asio::buffer(text.data(), text.size()), std::move(h));
            });
            beast::get_lowest_layer(ws_).expires_never();
            if (ec) return Err(make_error(ec, "send"));
            return {};
        }

        hearth_detail::expected<std::string, TransportError> receive_text(std::chrono::milliseconds timeout) override {
            if (closed_) return Err(TransportError{TransportErrc::Connection, "receive: connection closed"});
            buffer_.clear();
            beast::get_lowest_layer(ws_).expires_after(timeout);
            const auto ec = run_op(ioc_, [&](auto h) { ws_.async_read(buffer_, std::move(h)); });
            beast::get_lowest_layer(ws_).expires_never();
            if (ec) return Err(make_error(ec, "receive"));
            return beast::buffers_to_string(buffer_.data());
        }

        void close() noexcept override {
            if (closed_) return;
            closed_ = true;
            if (ws_.is_open()) {
                beast::get_lowest_layer(ws_).expires_after(
                    std::chrono::milliseconds(hearth::config::constants::WEBSOCKET_CLOSE_TIMEOUT_MS));
                (void)run_op(ioc_, [&](auto h) { ws_.async_close(websocket::close_code::normal, std::move(h)); });
            }
            beast::error_code ignored;
            beast::get_lowest_layer(ws_).socket().close(ignored);
        }

    private:
        std::shared_ptr<asio::ssl::context> ssl_ctx_;  ///< Keeps the TLS context alive; null for plain
        asio::io_context                    ioc_;
        websocket::stream<NextLayer>        ws_;
        beast::flat_buffer                  buffer_;
        bool                                closed_{false};
    };

    } // namespace

    // ---------------------------------------------------------------------------
    // BeastHttpTransport
    // ---------------------------------------------------------------------------

    BeastHttpTransport::BeastHttpTransport(TlsOptions tls)
        : ssl_ctx_(asio::ssl::context::tls_client), tls_(std::move(tls)) {
        init_tls(ssl_ctx_, tls_);
    }

    hearth_detail::expected<HttpResponse, TransportError> BeastHttpTransport::send(const HttpRequest& request) {
        const Deadline deadline = deadline_after(request.timeout);
        asio::io_context ioc;

        auto endpoints = resolve(ioc, request.url, deadline);
        if (!endpoints) return Err(endpoints.error());

        beast::error_code ignored;
        if (request.url.tls()) {
            beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx_);
            if (auto ok = prepare_tls(stream, request.url, tls_); !ok) return Err(ok.error());

            beast::get_lowest_layer(stream).expires_at(deadline);
            if (auto ec = run_op(ioc, [&](auto h) {
                    beast::get_lowest_layer(stream).async_connect(*endpoints, std::move(h));
                });
                ec) {
                return Err(make_error(ec, "connect"));
            }
            if (auto ec = run_op(ioc, [&](auto h) {
                    stream.async_handshake(asio::ssl::stream_base::client, std::move(h));
                });
                ec) {
                return Err(make_error(ec, "tls handshake"));
            }
            auto res = exchange(ioc, stream, request, deadline);
            beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ignored);
            return res;
        }

        beast::tcp_stream stream(ioc);
        stream.expires_at(deadline);
        if (auto ec = run_op(ioc, [&](auto h) { stream.async_connect(*endpoints, std::move(h)); }); ec) {
            return Err(make_error(ec, "connect"));
        }
        auto res = exchange(ioc, stream, request, deadline);
        stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
        return res;
    }

    // ---------------------------------------------------------------------------
    // BeastWsConnector
    // ---------------------------------------------------------------------------

    BeastWsConnector::BeastWsConnector(TlsOptions tls)
        : ssl_ctx_(std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client)), tls_(std::move(tls)) {
        init_tls(*ssl_ctx_, tls_);
    }

    hearth_detail::expected<std::unique_ptr<WsConnection>, TransportError>
    BeastWsConnector::connect(const Url& url, std::chrono::milliseconds timeout) {
        const Deadline deadline = std::chrono::steady_clock::now() + timeout;
        if (url.tls()) {
            using Conn = BeastWsConnection<beast::ssl_stream<beast::tcp_stream>>;
            auto conn = std::make_unique<Conn>(ssl_ctx_, *ssl_ctx_);
            if (auto ok = conn->open(url, deadline, tls_); !ok) return Err(ok.error());
            return std::unique_ptr<WsConnection>(std::move(conn));
        }
        using Conn = BeastWsConnection<beast::tcp_stream>;
        auto conn = std::make_unique<Conn>(nullptr);
        if (auto ok = conn->open(url, deadline, tls_); !ok) return Err(ok.error());
        return std::unique_ptr<WsConnection>(std::move(conn));
    }

} // namespace hearth::net
