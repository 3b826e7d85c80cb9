/**
 * @file ws_client.cpp
 * @brief WebSocketClient: validation, admission, connection table and request composition.
 */
#include "hearth/net/ws_client.hpp"

#include <utility>
#include <vector>

namespace hearth::net {

    using core::ErrorKind;
    using core::OperationResult;
    using namespace hearth::config::constants;

    namespace {

    ErrorKind kind_of(const TransportError& e) noexcept {
        return e.code == TransportErrc::Timeout ? ErrorKind::Timeout : ErrorKind::Connection;
    }

    nlohmann::json parse_message(const std::string& text) {
        auto j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded()) return text;
        return j;
    }

    /// Closes a connection when the enclosing scope ends.
    class CloseGuard {
    public:
        explicit CloseGuard(WsConnection& c) noexcept : c_(c) {}
        ~CloseGuard() { c_.close(); }
        CloseGuard(const CloseGuard&)            = delete;
        CloseGuard& operator=(const CloseGuard&) = delete;

    private:
        WsConnection& c_;
    };

    } // namespace

    WebSocketClient::WebSocketClient(WsClientConfig cfg, std::shared_ptr<WsConnector> connector,
                                     std::shared_ptr<resilience::CircuitBreakerRegistry> breakers,
                                     core::Clock& clock, std::shared_ptr<obs::EventLogger> log,
                                     std::shared_ptr<obs::MetricsSink> metrics)
        : cfg_(std::move(cfg)),
          connector_(std::move(connector)),
          breakers_(std::move(breakers)),
          clock_(&clock),
          log_(std::move(log)),
          metrics_(std::move(metrics)),
          limiter_(cfg_.rate, clock) {}

    WebSocketClient::~WebSocketClient() {
        std::map<uint64_t, Connection> open;
        {
            std::lock_guard<std::mutex> lk(mu_);
            open.swap(connections_);
        }
        for (auto& [id, c] : open) c.conn->close();
    }

    void WebSocketClient::count(std::string_view metric, double value, std::string_view unit) {
        if (metrics_) metrics_->record(metric, value, unit);
    }

    OperationResult WebSocketClient::fail(ErrorKind kind, std::string message, const std::string& cid,
                                          nlohmann::json details) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        count("websocket.failure");
        return OperationResult::failure(kind, std::move(message), cid, std::move(details));
    }

    OperationResult WebSocketClient::rate_limited(const std::string& cid) {
        rate_limited_.fetch_add(1, std::memory_order_relaxed);
        count("websocket.rate_limited");
        log_->log_warn(cid, "WEBSOCKET", "rate limit exceeded", {{"ceiling", cfg_.rate.ceiling}});
        return fail(ErrorKind::RateLimit, "WebSocket rate limit exceeded", cid,
                    {{"ceiling", cfg_.rate.ceiling}, {"window_ms", cfg_.rate.window_ms}});
    }

    hearth_detail::expected<std::chrono::milliseconds, std::string>
    WebSocketClient::validate_timeout(uint32_t timeout_s) const {
        const uint32_t t = (timeout_s == 0) ? cfg_.default_timeout_s : timeout_s;
        if (t < WEBSOCKET_TIMEOUT_S_MIN || t > WEBSOCKET_TIMEOUT_S_MAX) {
            return hearth_detail::unexpected<std::string>("timeout must be in [1, 60] seconds, got " +
                                                          std::to_string(t));
        }
        return std::chrono::milliseconds(static_cast<int64_t>(t) * 1000);
    }

    hearth_detail::expected<WebSocketClient::Target, std::string>
    WebSocketClient::validate_target(std::string_view url, uint32_t timeout_s) const {
        using Err = hearth_detail::unexpected<std::string>;
        if (url.size() < WEBSOCKET_URL_MIN_LEN || url.size() > WEBSOCKET_URL_MAX_LEN) {
            return Err("URL length must be in [10, 500], got " + std::to_string(url.size()));
        }
        auto parsed = parse_url(url);
        if (!parsed) return Err("invalid URL: " + parsed.error());
        if (parsed->scheme != "ws" && parsed->scheme != "wss") return Err(std::string("URL must start with ws:// or wss://"));
        if (!cfg_.allow_private_hosts && is_private_host(parsed->host)) {
            return Err("host '" + parsed->host + "' is private or loopback");
        }
        auto timeout = validate_timeout(timeout_s);
        if (!timeout) return Err(timeout.error());
        return Target{std::move(*parsed), *timeout};
    }

    hearth_detail::expected<std::string, std::string> WebSocketClient::serialize(const nlohmann::json& message) const {
        using Err = hearth_detail::unexpected<std::string>;
        if (!message.is_object()) return Err(std::string("message must be a JSON object"));
        std::string text = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        if (text.size() > cfg_.max_message_bytes) {
            return Err("message of " + std::to_string(text.size()) + " bytes exceeds limit of " +
                       std::to_string(cfg_.max_message_bytes));
        }
        return text;
    }

    hearth_detail::expected<std::unique_ptr<WsConnection>, OperationResult>
    WebSocketClient::open(const Target& target, std::shared_ptr<resilience::CircuitBreaker>& breaker,
                          const std::string& cid, uint32_t& attempts_used) {
        using Err = hearth_detail::unexpected<OperationResult>;
        const std::string dependency = target.url.dependency();
        breaker = breakers_->get(dependency);
        if (breaker->try_acquire() == resilience::Admission::Rejected) {
            circuit_rejected_.fetch_add(1, std::memory_order_relaxed);
            count("websocket.circuit_rejected");
            return Err(fail(ErrorKind::CircuitOpen, "circuit open for " + dependency, cid,
                            {{"dependency", dependency}, {"state", std::string(to_string(breaker->state()))}}));
        }

        const RetryPolicy& policy = cfg_.retry;
        TransportError last;
        for (uint32_t attempt = 0; attempt < policy.max_attempts; ++attempt) {
            attempts_used = attempt + 1;
            if (attempt > 0) {
                retries_.fetch_add(1, std::memory_order_relaxed);
                count("websocket.retries");
            }
            auto conn = connector_->connect(target.url, target.timeout);
            if (conn) return std::move(*conn);

            breaker->record_failure();
            last = conn.error();
            if (last.code == TransportErrc::Protocol) break;
            if (attempt + 1 < policy.max_attempts) {
                const auto delay = policy.backoff_delay(attempt);
                log_->log_warn(cid, "WEBSOCKET", "connect failed, backing off",
                               {{"dependency", dependency}, {"attempt", attempts_used},
                                {"delay_ms", delay.count()}, {"error", last.message}});
                clock_->sleep_for(delay);
            }
        }

        nlohmann::json details = {{"attempts_used", attempts_used},
                                  {"last_error_kind", std::string(to_string(kind_of(last)))},
                                  {"last_error", last.message},
                                  {"dependency", dependency}};
        log_->log_error(cid, "WEBSOCKET", "connect failed", details);
        if (last.code == TransportErrc::Protocol || policy.max_attempts == 1) {
            return Err(fail(kind_of(last), last.message, cid, std::move(details)));
        }
        return Err(fail(ErrorKind::RetryExhausted,
                        "connect failed after " + std::to_string(attempts_used) + " attempt(s): " + last.message,
                        cid, std::move(details)));
    }

    std::shared_ptr<WsConnection> WebSocketClient::lookup(uint64_t id) const {
        std::lock_guard<std::mutex> lk(mu_);
        const auto it = connections_.find(id);
        return it == connections_.end() ? nullptr : it->second.conn;
    }

    std::shared_ptr<WsConnection> WebSocketClient::detach(uint64_t id) {
        std::lock_guard<std::mutex> lk(mu_);
        const auto it = connections_.find(id);
        if (it == connections_.end()) return nullptr;
        auto conn = std::move(it->second.conn);
        connections_.erase(it);
        return conn;
    }

    OperationResult WebSocketClient::connect(std::string_view url, uint32_t timeout_s, const std::string& cid) {
        // Malformed input is rejected before it can spend a rate-limit slot.
        auto target = validate_target(url, timeout_s);
        if (!target) return fail(ErrorKind::Validation, target.error(), cid);
        if (!limiter_.check_and_record()) return rate_limited(cid);

        if (open_connections() >= cfg_.max_connections) {
            return fail(ErrorKind::RateLimit, "open connection limit reached", cid,
                        {{"max_connections", cfg_.max_connections}});
        }

        std::shared_ptr<resilience::CircuitBreaker> breaker;
        uint32_t used = 0;
        auto opened = open(*target, breaker, cid, used);
        if (!opened) return std::move(opened.error());
        breaker->record_success();

        std::shared_ptr<WsConnection> conn(std::move(*opened));
        uint64_t id = 0;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (connections_.size() < cfg_.max_connections) {
                id = next_id_++;
                connections_.emplace(id, Connection{conn, std::string(url), target->url.dependency(), clock_->now()});
            }
        }
        if (id == 0) {
            conn->close();
            return fail(ErrorKind::RateLimit, "open connection limit reached", cid,
                        {{"max_connections", cfg_.max_connections}});
        }

        connects_.fetch_add(1, std::memory_order_relaxed);
        count("websocket.connects");
        log_->log_info(cid, "WEBSOCKET", "connected", {{"connection_id", id}, {"dependency", target->url.dependency()}});
        return OperationResult::ok({{"connection_id", id}, {"url", std::string(url)}, {"attempts_used", used}}, cid);
    }

    OperationResult WebSocketClient::send(uint64_t id, const nlohmann::json& message, const std::string& cid) {
        auto text = serialize(message);
        if (!text) return fail(ErrorKind::Validation, text.error(), cid);
        if (!limiter_.check_and_record()) return rate_limited(cid);

        auto conn = lookup(id);
        if (!conn) return fail(ErrorKind::NotFound, "unknown connection id " + std::to_string(id), cid);

        const auto timeout = std::chrono::milliseconds(static_cast<int64_t>(cfg_.default_timeout_s) * 1000);
        if (auto sent = conn->send_text(*text, timeout); !sent) {
            if (auto dropped = detach(id)) dropped->close();
            return fail(kind_of(sent.error()), sent.error().message, cid,
                        {{"connection_id", id}, {"connection_closed", true}});
        }
        messages_sent_.fetch_add(1, std::memory_order_relaxed);
        count("websocket.bytes_sent", static_cast<double>(text->size()), "bytes");
        return OperationResult::ok({{"connection_id", id}, {"bytes", text->size()}}, cid);
    }

    OperationResult WebSocketClient::receive(uint64_t id, uint32_t timeout_s, const std::string& cid) {
        auto timeout = validate_timeout(timeout_s);
        if (!timeout) return fail(ErrorKind::Validation, timeout.error(), cid);
        if (!limiter_.check_and_record()) return rate_limited(cid);

        auto conn = lookup(id);
        if (!conn) return fail(ErrorKind::NotFound, "unknown connection id " + std::to_string(id), cid);

        auto text = conn->receive_text(*timeout);
        if (!text) {
            if (auto dropped = detach(id)) dropped->close();
            return fail(kind_of(text.error()), text.error().message, cid,
                        {{"connection_id", id}, {"connection_closed", true}});
        }
        messages_received_.fetch_add(1, std::memory_order_relaxed);
        return OperationResult::ok({{"connection_id", id}, {"message", parse_message(*text)}}, cid);
    }

    OperationResult WebSocketClient::close(uint64_t id, const std::string& cid) {
        auto conn = detach(id);
        if (!conn) return fail(ErrorKind::NotFound, "unknown connection id " + std::to_string(id), cid);
        conn->close();
        closes_.fetch_add(1, std::memory_order_relaxed);
        log_->log_debug(cid, "WEBSOCKET", "closed", {{"connection_id", id}});
        return OperationResult::ok({{"connection_id", id}, {"closed", true}}, cid);
    }

    OperationResult WebSocketClient::request(std::string_view url, const nlohmann::json& message,
                                             uint32_t timeout_s, const std::string& cid) {
        requests_.fetch_add(1, std::memory_order_relaxed);
        count("websocket.requests");

        auto target = validate_target(url, timeout_s);
        if (!target) return fail(ErrorKind::Validation, target.error(), cid);
        auto text = serialize(message);
        if (!text) return fail(ErrorKind::Validation, text.error(), cid);
        if (!limiter_.check_and_record()) return rate_limited(cid);

        std::shared_ptr<resilience::CircuitBreaker> breaker;
        uint32_t used = 0;
        auto opened = open(*target, breaker, cid, used);
        if (!opened) return std::move(opened.error());

        std::unique_ptr<WsConnection> conn = std::move(*opened);
        CloseGuard guard(*conn);
        closes_.fetch_add(1, std::memory_order_relaxed);

        if (auto sent = conn->send_text(*text, target->timeout); !sent) {
            breaker->record_failure();
            return fail(kind_of(sent.error()), sent.error().message, cid,
                        {{"stage", "send"}, {"attempts_used", used}});
        }
        messages_sent_.fetch_add(1, std::memory_order_relaxed);

        auto reply = conn->receive_text(target->timeout);
        if (!reply) {
            breaker->record_failure();
            log_->log_error(cid, "WEBSOCKET", "request failed after send",
                            {{"stage", "receive"}, {"error", reply.error().message}});
            return fail(kind_of(reply.error()), reply.error().message, cid,
                        {{"stage", "receive"}, {"attempts_used", used}});
        }
        messages_received_.fetch_add(1, std::memory_order_relaxed);
        breaker->record_success();
        return OperationResult::ok({{"message", parse_message(*reply)}, {"attempts_used", used}}, cid);
    }

    std::size_t WebSocketClient::open_connections() const {
        std::lock_guard<std::mutex> lk(mu_);
        return connections_.size();
    }

    nlohmann::json WebSocketClient::stats_json() const {
        return {{"open_connections", open_connections()},
                {"connects", connects_.load(std::memory_order_relaxed)},
                {"closes", closes_.load(std::memory_order_relaxed)},
                {"messages_sent", messages_sent_.load(std::memory_order_relaxed)},
                {"messages_received", messages_received_.load(std::memory_order_relaxed)},
                {"requests", requests_.load(std::memory_order_relaxed)},
                {"failed", failed_.load(std::memory_order_relaxed)},
                {"retries", retries_.load(std::memory_order_relaxed)},
                {"rate_limited", rate_limited_.load(std::memory_order_relaxed)},
                {"circuit_rejected", circuit_rejected_.load(std::memory_order_relaxed)}};
    }

    void WebSocketClient::reset() {
        std::map<uint64_t, Connection> open;
        {
            std::lock_guard<std::mutex> lk(mu_);
            open.swap(connections_);
        }
        for (auto& [id, c] : open) c.conn->close();
        for (auto* c : {&connects_, &messages_sent_, &messages_received_, &closes_, &requests_, &failed_,
                        &retries_, &rate_limited_, &circuit_rejected_}) {
            c->store(0, std::memory_order_relaxed);
        }
        limiter_.reset();
    }

} // namespace hearth::net
