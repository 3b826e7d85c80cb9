/**
 * @file gateway.cpp
 * @brief Gateway dispatch, component wiring and per-interface handlers.
 */
#include "hearth/gateway/gateway.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <utility>
#include <variant>
#include <vector>

#include "hearth/net/beast_transport.hpp"

namespace hearth::gateway {

    using core::ErrorKind;
    using core::OperationResult;
    using nlohmann::json;

    namespace {

    using Err = hearth_detail::unexpected<std::string>;

    // --------------------------- Argument access ---------------------------------

    template <class T>
    hearth_detail::expected<T, std::string> required(const json& kw, const char* key) {
        const auto it = kw.find(key);
        if (it == kw.end() || it->is_null()) return Err(std::string("missing required argument '") + key + "'");
        try {
            return it->get<T>();
        } catch (const json::exception&) {
            return Err(std::string("argument '") + key + "' has the wrong type");
        }
    }

    template <class T>
    hearth_detail::expected<T, std::string> optional_arg(const json& kw, const char* key, T fallback) {
        const auto it = kw.find(key);
        if (it == kw.end() || it->is_null()) return fallback;
        try {
            return it->get<T>();
        } catch (const json::exception&) {
            return Err(std::string("argument '") + key + "' has the wrong type");
        }
    }

    /// Non-negative integer argument no larger than @p max.
    hearth_detail::expected<uint64_t, std::string> bounded(const json& kw, const char* key, int64_t fallback, int64_t max) {
        const auto it = kw.find(key);
        if (it == kw.end() || it->is_null()) return static_cast<uint64_t>(fallback);
        if (!it->is_number_integer()) return Err(std::string("argument '") + key + "' must be an integer");
        const auto v = it->get<int64_t>();
        if (v < 0 || v > max) {
            return Err(std::string("argument '") + key + "' must be in [0, " + std::to_string(max) + "]");
        }
        return static_cast<uint64_t>(v);
    }

    /// Positive connection id; absence is an error.
    hearth_detail::expected<uint64_t, std::string> connection_id(const json& kw) {
        if (!kw.contains("connection_id")) return Err(std::string("missing required argument 'connection_id'"));
        auto id = bounded(kw, "connection_id", 0, INT64_MAX);
        if (!id) return Err(id.error());
        if (*id == 0) return Err(std::string("argument 'connection_id' must be positive"));
        return *id;
    }

    OperationResult invalid(std::string message, const std::string& cid) {
        return OperationResult::failure(ErrorKind::Validation, std::move(message), cid);
    }

    OperationResult unavailable(std::string_view name, core::RegistryErr e, const std::string& cid) {
        return OperationResult::failure(ErrorKind::Internal,
                                        "component '" + std::string(name) + "' unavailable: " +
                                            std::string(core::to_string(e)),
                                        cid);
    }

    hearth_detail::expected<net::RequestOptions, std::string> request_options(const json& kw, const std::string& cid) {
        net::RequestOptions o;
        o.correlation_id = cid;

        if (const auto h = kw.find("headers"); h != kw.end() && !h->is_null()) {
            if (!h->is_object()) return Err(std::string("argument 'headers' must be an object"));
            for (auto it = h->begin(); it != h->end(); ++it) {
                if (!it.value().is_string()) return Err("header '" + it.key() + "' must be a string");
                o.headers.insert_or_assign(it.key(), it.value().get<std::string>());
            }
        }
        if (const auto body = kw.find("json"); body != kw.end()) {
            o.json_body = *body;
        } else if (const auto data = kw.find("data"); data != kw.end()) {
            o.json_body = *data;
        }

        auto timeout = optional_arg<double>(kw, "timeout", 0.0);
        if (!timeout) return Err(timeout.error());
        if (*timeout < 0.0) return Err(std::string("argument 'timeout' must not be negative"));
        o.timeout = std::chrono::milliseconds(std::llround(*timeout * 1000.0));

        auto use_retry = optional_arg<bool>(kw, "use_retry", true);
        if (!use_retry) return Err(use_retry.error());
        o.use_retry = *use_retry;

        auto ttl = bounded(kw, "cache_ttl", 0, hearth::config::constants::CACHE_MAX_TTL_S);
        if (!ttl) return Err(ttl.error());
        o.cache_ttl_s = static_cast<int32_t>(*ttl);

        auto dependency = optional_arg<std::string>(kw, "dependency", std::string{});
        if (!dependency) return Err(dependency.error());
        o.dependency = std::move(*dependency);
        return o;
    }

    /// Components that hold a reference to @p name and must be rebuilt with it.
    std::vector<std::string_view> dependents_of(std::string_view name) {
        if (name == component::kCircuitBreakers) return {component::kHttpClient, component::kWebSocket};
        if (name == component::kCache) return {component::kHttpClient};
        return {};
    }

    std::string_view http_verb(HttpOp op) noexcept {
        switch (op) {
            case HttpOp::Get:    return "GET";
            case HttpOp::Post:   return "POST";
            case HttpOp::Put:    return "PUT";
            case HttpOp::Delete: return "DELETE";
            case HttpOp::Patch:  return "PATCH";
            default:             return "";
        }
    }

    } // namespace

    // -----------------------------------------------------------------------------
    // Construction and component resolution
    // -----------------------------------------------------------------------------

    Gateway::Gateway(core::SingletonRegistry& registry, GatewayOptions options)
        : registry_(registry),
          opts_(std::move(options)),
          clock_(opts_.clock ? opts_.clock : &core::steady_clock()),
          log_(opts_.logger ? opts_.logger : obs::null_logger()),
          metrics_(opts_.metrics ? opts_.metrics : std::make_shared<obs::InMemoryMetrics>()),
          rng_(std::random_device{}()) {}

    hearth_detail::expected<std::shared_ptr<resilience::CircuitBreakerRegistry>, core::RegistryErr> Gateway::breakers() {
        return registry_.get_or_create<resilience::CircuitBreakerRegistry>(component::kCircuitBreakers, [this] {
            auto reg = std::make_shared<resilience::CircuitBreakerRegistry>(opts_.runtime.breaker, *clock_, log_);
            for (const auto& [dependency, cfg] : opts_.runtime.breaker_overrides) reg->set_override(dependency, cfg);
            return reg;
        });
    }

    hearth_detail::expected<std::shared_ptr<cache::TtlCache>, core::RegistryErr> Gateway::ttl_cache() {
        return registry_.get_or_create<cache::TtlCache>(component::kCache, [this] {
            std::shared_ptr<os::MemoryGauge> gauge = opts_.memory_gauge;
            if (!gauge && opts_.runtime.host_memory_limit_mb > 0) {
                gauge = std::make_shared<os::ProcessMemoryGauge>(opts_.runtime.host_memory_limit_mb);
            }
            return std::make_shared<cache::TtlCache>(opts_.runtime.cache_settings, *clock_, std::move(gauge), log_);
        });
    }

    hearth_detail::expected<std::shared_ptr<net::RetryingHttpClient>, core::RegistryErr> Gateway::http_client() {
        // Dependencies first: factories run under the registry lock and must not re-enter it.
        auto b = breakers();
        if (!b) return hearth_detail::unexpected<core::RegistryErr>(b.error());
        auto c = ttl_cache();
        if (!c) return hearth_detail::unexpected<core::RegistryErr>(c.error());

        return registry_.get_or_create<net::RetryingHttpClient>(component::kHttpClient, [&] {
            std::shared_ptr<net::HttpTransport> transport;
            if (opts_.http_transport) {
                transport = opts_.http_transport();
            } else {
                transport = std::make_shared<net::BeastHttpTransport>();
            }
            return std::make_shared<net::RetryingHttpClient>(opts_.runtime.http, std::move(transport), *b, *clock_,
                                                             *c, log_, metrics_);
        });
    }

    hearth_detail::expected<std::shared_ptr<net::WebSocketClient>, core::RegistryErr> Gateway::websocket() {
        auto b = breakers();
        if (!b) return hearth_detail::unexpected<core::RegistryErr>(b.error());

        return registry_.get_or_create<net::WebSocketClient>(component::kWebSocket, [&] {
            std::shared_ptr<net::WsConnector> connector;
            if (opts_.ws_connector) {
                connector = opts_.ws_connector();
            } else {
                connector = std::make_shared<net::BeastWsConnector>();
            }
            return std::make_shared<net::WebSocketClient>(opts_.runtime.websocket, std::move(connector), *b, *clock_,
                                                          log_, metrics_);
        });
    }

    hearth_detail::expected<std::shared_ptr<config::ConfigProvider>, core::RegistryErr> Gateway::config_provider() {
        return registry_.get_or_create<config::ConfigProvider>(component::kConfig, [this] {
            return std::make_shared<config::JsonConfigProvider>(opts_.runtime.document);
        });
    }

    // -----------------------------------------------------------------------------
    // Dispatch
    // -----------------------------------------------------------------------------

    std::string Gateway::correlation_id(const json& kwargs) {
        if (kwargs.is_object()) {
            const auto it = kwargs.find("correlation_id");
            if (it != kwargs.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
                return it->get<std::string>();
            }
        }
        char buf[17];
        std::lock_guard<std::mutex> lk(mu_);
        std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(rng_()));
        return buf;
    }

    void Gateway::count_call(const Operation& op) {
        std::string key(interface_name(op));
        key += '.';
        key += operation_name(op);
        std::lock_guard<std::mutex> lk(mu_);
        ++total_calls_;
        ++calls_[key];
    }

    OperationResult Gateway::execute(std::string_view interface, std::string_view operation, const json& kwargs_in) {
        const json kwargs = kwargs_in.is_null() ? json::object() : kwargs_in;
        const std::string cid = correlation_id(kwargs);

        auto parsed = parse_operation(interface, operation);
        if (!parsed) {
            {
                std::lock_guard<std::mutex> lk(mu_);
                ++total_calls_;
                ++dispatch_errors_;
            }
            metrics_->record("gateway.dispatch_errors", 1.0);
            log_->log_warn(cid, "GATEWAY", "dispatch failed",
                           {{"interface", std::string(interface)}, {"operation", std::string(operation)}});
            json details = {{"interface", std::string(interface)}, {"operation", std::string(operation)}};
            json known = json::array();
            const auto ops = operations_of(interface);
            for (auto name : (ops.empty() ? interfaces() : ops)) known.push_back(std::string(name));
            details[ops.empty() ? "interfaces" : "operations"] = std::move(known);
            return OperationResult::failure(ErrorKind::Dispatch, parsed.error(), cid, std::move(details));
        }
        if (!kwargs.is_object()) return invalid("kwargs must be a JSON object", cid);

        const Operation op = *parsed;
        count_call(op);
        const auto started = clock_->now();

        OperationResult result;
        try {
            result = std::visit([&](auto o) { return handle(o, kwargs, cid); }, op);
        } catch (const std::exception& e) {
            log_->log_error(cid, "GATEWAY", "operation raised",
                            {{"interface", std::string(interface)}, {"operation", std::string(operation)},
                             {"error", e.what()}});
            result = OperationResult::failure(ErrorKind::Internal, e.what(), cid);
        } catch (...) {
            log_->log_error(cid, "GATEWAY", "operation raised a non-standard exception",
                            {{"interface", std::string(interface)}, {"operation", std::string(operation)}});
            result = OperationResult::failure(ErrorKind::Internal, "unknown exception", cid);
        }
        result.correlation_id = cid;

        const double ms = std::chrono::duration<double, std::milli>(clock_->now() - started).count();
        metrics_->record("gateway.calls", 1.0);
        metrics_->record("gateway.latency_ms", ms, "ms");
        if (!result.success) metrics_->record("gateway.errors", 1.0);

        json fields = {{"interface", std::string(interface)},
                       {"operation", std::string(operation)},
                       {"success", result.success},
                       {"duration_ms", ms}};
        if (result.success) {
            log_->log_info(cid, "GATEWAY", "operation completed", fields);
        } else {
            fields["error_kind"] = std::string(core::to_string(result.error_kind));
            fields["error"] = result.error;
            log_->log_warn(cid, "GATEWAY", "operation failed", fields);
        }
        return result;
    }

    json Gateway::stats() const {
        std::lock_guard<std::mutex> lk(mu_);
        json ops = json::object();
        for (const auto& [name, n] : calls_) ops[name] = n;
        return {{"total", total_calls_}, {"dispatch_errors", dispatch_errors_}, {"operations", std::move(ops)}};
    }

    // -----------------------------------------------------------------------------
    // Handlers
    // -----------------------------------------------------------------------------

    OperationResult Gateway::handle(CacheOp op, const json& kw, const std::string& cid) {
        auto c = ttl_cache();
        if (!c) return unavailable(component::kCache, c.error(), cid);
        cache::TtlCache& store = **c;

        switch (op) {
            case CacheOp::Get: {
                auto key = required<std::string>(kw, "key");
                if (!key) return invalid(key.error(), cid);
                auto value = store.get(*key);
                metrics_->record(value ? "cache.hit" : "cache.miss", 1.0);
                return OperationResult::ok({{"key", *key}, {"hit", value.has_value()},
                                            {"value", value ? std::move(*value) : json(nullptr)}}, cid);
            }
            case CacheOp::Set: {
                auto key = required<std::string>(kw, "key");
                if (!key) return invalid(key.error(), cid);
                if (!kw.contains("value")) return invalid("missing required argument 'value'", cid);
                const auto ttl_it = kw.find("ttl");
                int64_t ttl = 0;
                if (ttl_it != kw.end() && !ttl_it->is_null()) {
                    if (!ttl_it->is_number_integer()) return invalid("argument 'ttl' must be an integer", cid);
                    ttl = ttl_it->get<int64_t>();
                    if (ttl > INT32_MAX) ttl = INT32_MAX;
                    if (ttl < INT32_MIN) ttl = -1;
                }
                const auto rc = store.set(*key, kw.at("value"), static_cast<int32_t>(ttl));
                if (rc != cache::CacheErr::Ok) {
                    return OperationResult::failure(ErrorKind::Validation,
                                                    "cache set rejected: " + std::string(cache::to_string(rc)), cid,
                                                    {{"key", *key}});
                }
                metrics_->record("cache.set", 1.0);
                return OperationResult::ok({{"key", *key}, {"stored", true}}, cid);
            }
            case CacheOp::Exists: {
                auto key = required<std::string>(kw, "key");
                if (!key) return invalid(key.error(), cid);
                return OperationResult::ok({{"key", *key}, {"exists", store.exists(*key)}}, cid);
            }
            case CacheOp::Delete: {
                auto key = required<std::string>(kw, "key");
                if (!key) return invalid(key.error(), cid);
                return OperationResult::ok({{"key", *key}, {"deleted", store.invalidate(*key)}}, cid);
            }
            case CacheOp::Clear:
                return OperationResult::ok({{"cleared", store.clear()}}, cid);
            case CacheOp::CleanupExpired:
                return OperationResult::ok({{"removed", store.cleanup_expired()}}, cid);
            case CacheOp::Maintain:
                return OperationResult::ok(store.maintain().to_json(), cid);
            case CacheOp::GetMetadata: {
                auto key = required<std::string>(kw, "key");
                if (!key) return invalid(key.error(), cid);
                auto md = store.metadata(*key);
                return OperationResult::ok({{"key", *key}, {"found", md.has_value()},
                                            {"metadata", md ? md->to_json() : json(nullptr)}}, cid);
            }
            case CacheOp::GetStats: {
                json s = store.stats_json();
                s["pressure"] = store.pressure();
                return OperationResult::ok(std::move(s), cid);
            }
        }
        return OperationResult::failure(ErrorKind::Dispatch, "unhandled cache operation", cid);
    }

    OperationResult Gateway::handle(HttpOp op, const json& kw, const std::string& cid) {
        auto c = http_client();
        if (!c) return unavailable(component::kHttpClient, c.error(), cid);
        net::RetryingHttpClient& client = **c;

        switch (op) {
            case HttpOp::Request:
            case HttpOp::Get:
            case HttpOp::Post:
            case HttpOp::Put:
            case HttpOp::Delete:
            case HttpOp::Patch: {
                std::string method(http_verb(op));
                if (op == HttpOp::Request) {
                    auto m = required<std::string>(kw, "method");
                    if (!m) return invalid(m.error(), cid);
                    method = std::move(*m);
                }
                auto url = required<std::string>(kw, "url");
                if (!url) return invalid(url.error(), cid);
                auto options = request_options(kw, cid);
                if (!options) return invalid(options.error(), cid);
                return client.request(method, *url, *options);
            }
            case HttpOp::ConfigureRetry: {
                auto policy = net::retry_policy_from_json(kw, client.retry_policy());
                if (!policy) return invalid(policy.error(), cid);
                if (auto applied = client.configure_retry(*policy); !applied) return invalid(applied.error(), cid);
                log_->log_info(cid, "HTTP", "retry policy replaced", policy->to_json());
                return OperationResult::ok({{"retry_policy", client.retry_policy().to_json()}}, cid);
            }
            case HttpOp::GetStats:
                return OperationResult::ok(client.stats_json(), cid);
            case HttpOp::Reset:
                client.reset();
                return OperationResult::ok({{"reset", true}}, cid);
        }
        return OperationResult::failure(ErrorKind::Dispatch, "unhandled http_client operation", cid);
    }

    OperationResult Gateway::handle(WebSocketOp op, const json& kw, const std::string& cid) {
        auto c = websocket();
        if (!c) return unavailable(component::kWebSocket, c.error(), cid);
        net::WebSocketClient& client = **c;

        const auto timeout = bounded(kw, "timeout", 0, hearth::config::constants::WEBSOCKET_TIMEOUT_S_MAX);
        if (!timeout) return invalid(timeout.error(), cid);
        const auto timeout_s = static_cast<uint32_t>(*timeout);

        switch (op) {
            case WebSocketOp::Connect: {
                auto url = required<std::string>(kw, "url");
                if (!url) return invalid(url.error(), cid);
                return client.connect(*url, timeout_s, cid);
            }
            case WebSocketOp::Send: {
                auto id = connection_id(kw);
                if (!id) return invalid(id.error(), cid);
                if (!kw.contains("message")) return invalid("missing required argument 'message'", cid);
                return client.send(*id, kw.at("message"), cid);
            }
            case WebSocketOp::Receive: {
                auto id = connection_id(kw);
                if (!id) return invalid(id.error(), cid);
                return client.receive(*id, timeout_s, cid);
            }
            case WebSocketOp::Close: {
                auto id = connection_id(kw);
                if (!id) return invalid(id.error(), cid);
                return client.close(*id, cid);
            }
            case WebSocketOp::Request: {
                auto url = required<std::string>(kw, "url");
                if (!url) return invalid(url.error(), cid);
                if (!kw.contains("message")) return invalid("missing required argument 'message'", cid);
                return client.request(*url, kw.at("message"), timeout_s, cid);
            }
            case WebSocketOp::GetStats:
                return OperationResult::ok(client.stats_json(), cid);
            case WebSocketOp::Reset:
                client.reset();
                return OperationResult::ok({{"reset", true}}, cid);
        }
        return OperationResult::failure(ErrorKind::Dispatch, "unhandled websocket operation", cid);
    }

    OperationResult Gateway::handle(BreakerOp op, const json& kw, const std::string& cid) {
        auto b = breakers();
        if (!b) return unavailable(component::kCircuitBreakers, b.error(), cid);
        resilience::CircuitBreakerRegistry& reg = **b;

        switch (op) {
            case BreakerOp::GetState: {
                auto dependency = required<std::string>(kw, "dependency");
                if (!dependency) return invalid(dependency.error(), cid);
                return OperationResult::ok(reg.get(*dependency)->snapshot().to_json(), cid);
            }
            case BreakerOp::GetAllStates: {
                json all = json::object();
                for (const auto& snap : reg.snapshots()) all[snap.name] = snap.to_json();
                return OperationResult::ok({{"breakers", std::move(all)}, {"count", reg.size()}}, cid);
            }
            case BreakerOp::Reset: {
                auto dependency = required<std::string>(kw, "dependency");
                if (!dependency) return invalid(dependency.error(), cid);
                auto breaker = reg.find(*dependency);
                if (!breaker) {
                    return OperationResult::failure(ErrorKind::NotFound, "no circuit breaker for '" + *dependency + "'", cid);
                }
                breaker->reset();
                return OperationResult::ok(breaker->snapshot().to_json(), cid);
            }
            case BreakerOp::ResetAll:
                reg.reset_all();
                return OperationResult::ok({{"reset", reg.size()}}, cid);
        }
        return OperationResult::failure(ErrorKind::Dispatch, "unhandled circuit_breaker operation", cid);
    }

    OperationResult Gateway::handle(SingletonOp op, const json& kw, const std::string& cid) {
        switch (op) {
            case SingletonOp::Exists: {
                auto name = required<std::string>(kw, "name");
                if (!name) return invalid(name.error(), cid);
                return OperationResult::ok({{"name", *name}, {"exists", registry_.exists(*name)}}, cid);
            }
            case SingletonOp::Delete: {
                auto name = required<std::string>(kw, "name");
                if (!name) return invalid(name.error(), cid);
                const bool removed = registry_.remove(*name);
                json cascaded = json::array();
                if (removed) {
                    for (auto dependent : dependents_of(*name)) {
                        if (registry_.remove(dependent)) cascaded.push_back(std::string(dependent));
                    }
                    log_->log_info(cid, "SINGLETON", "instance deleted",
                                   {{"name", *name}, {"dependents_deleted", cascaded}});
                }
                return OperationResult::ok({{"name", *name}, {"deleted", removed}, {"dependents_deleted", cascaded}},
                                           cid);
            }
            case SingletonOp::List: {
                const auto names = registry_.names();
                return OperationResult::ok({{"names", names}, {"count", names.size()}}, cid);
            }
            case SingletonOp::GetStats: {
                const auto s = registry_.stats();
                return OperationResult::ok({{"instances", registry_.size()},
                                            {"creates", s.creates},
                                            {"hits", s.hits},
                                            {"replaces", s.replaces},
                                            {"removes", s.removes},
                                            {"failures", s.failures}},
                                           cid);
            }
        }
        return OperationResult::failure(ErrorKind::Dispatch, "unhandled singleton operation", cid);
    }

    OperationResult Gateway::handle(ConfigOp op, const json& kw, const std::string& cid) {
        auto p = config_provider();
        if (!p) return unavailable(component::kConfig, p.error(), cid);

        switch (op) {
            case ConfigOp::Get: {
                auto key = required<std::string>(kw, "key");
                if (!key) return invalid(key.error(), cid);
                auto value = (*p)->get(*key);
                const json fallback = kw.contains("default") ? kw.at("default") : json(nullptr);
                return OperationResult::ok({{"key", *key}, {"found", value.has_value()},
                                            {"value", value ? std::move(*value) : fallback}}, cid);
            }
        }
        return OperationResult::failure(ErrorKind::Dispatch, "unhandled config operation", cid);
    }

    OperationResult Gateway::handle(LoggingOp op, const json& kw, const std::string& cid) {
        auto message = required<std::string>(kw, "message");
        if (!message) return invalid(message.error(), cid);
        auto tag = optional_arg<std::string>(kw, "tag", std::string("GATEWAY"));
        if (!tag) return invalid(tag.error(), cid);
        const json fields = kw.contains("fields") ? kw.at("fields") : json(nullptr);

        switch (op) {
            case LoggingOp::Info:
                log_->log_info(cid, *tag, *message, fields);
                return OperationResult::ok({{"logged", true}, {"level", "info"}}, cid);
            case LoggingOp::Error:
                log_->log_error(cid, *tag, *message, fields);
                return OperationResult::ok({{"logged", true}, {"level", "error"}}, cid);
        }
        return OperationResult::failure(ErrorKind::Dispatch, "unhandled logging operation", cid);
    }

    OperationResult Gateway::handle(MetricsOp op, const json& kw, const std::string& cid) {
        switch (op) {
            case MetricsOp::Record: {
                auto name = required<std::string>(kw, "name");
                if (!name) return invalid(name.error(), cid);
                if (name->empty()) return invalid("argument 'name' must not be empty", cid);
                auto value = required<double>(kw, "value");
                if (!value) return invalid(value.error(), cid);
                if (!std::isfinite(*value)) return invalid("argument 'value' must be finite", cid);
                auto unit = optional_arg<std::string>(kw, "unit", std::string("count"));
                if (!unit) return invalid(unit.error(), cid);
                metrics_->record(*name, *value, *unit);
                return OperationResult::ok({{"name", *name}, {"recorded", true}}, cid);
            }
            case MetricsOp::Snapshot:
                return OperationResult::ok({{"metrics", metrics_->to_json()}}, cid);
        }
        return OperationResult::failure(ErrorKind::Dispatch, "unhandled metrics operation", cid);
    }

} // namespace hearth::gateway
