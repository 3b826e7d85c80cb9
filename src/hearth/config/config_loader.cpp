/**
 * @file config_loader.cpp
 * @brief JSON loader with range validation; every default comes from constants.hpp.
 */
#include "hearth/config/config_loader.hpp"

#include <fstream>
#include <type_traits>

#include <spdlog/common.h>

namespace hearth::config {
    using namespace hearth::config::constants;
    using Err = hearth_detail::unexpected<std::string>;

    namespace {

    /// Numeric field of @p section, @p fallback when absent, rejected outside [lo, hi].
    template <class T>
    hearth_detail::expected<T, std::string> read_number(const nlohmann::json& section, std::string_view path,
                                                        const char* key, T fallback, T lo, T hi) {
        if (!section.contains(key)) return fallback;
        const auto& v = section.at(key);
        const std::string name = std::string(path) + "." + key;
        if constexpr (std::is_floating_point_v<T>) {
            if (!v.is_number()) return Err(name + " must be a number");
            const T x = v.get<T>();
            if (!(x >= lo && x <= hi)) {
                return Err(name + " must be in [" + std::to_string(lo) + ", " + std::to_string(hi) + "]");
            }
            return x;
        } else {
            if (!v.is_number_integer()) return Err(name + " must be an integer");
            const auto x = v.get<int64_t>();
            if (x < static_cast<int64_t>(lo) || x > static_cast<int64_t>(hi)) {
                return Err(name + " must be in [" + std::to_string(lo) + ", " + std::to_string(hi) + "]");
            }
            return static_cast<T>(x);
        }
    }

    hearth_detail::expected<bool, std::string> read_bool(const nlohmann::json& section, std::string_view path,
                                                         const char* key, bool fallback) {
        if (!section.contains(key)) return fallback;
        if (!section.at(key).is_boolean()) return Err(std::string(path) + "." + key + " must be a boolean");
        return section.at(key).get<bool>();
    }

    hearth_detail::expected<nlohmann::json, std::string> section_of(const nlohmann::json& doc, const char* name) {
        if (!doc.contains(name)) return nlohmann::json::object();
        if (!doc.at(name).is_object()) return Err(std::string(name) + " must be an object");
        return doc.at(name);
    }

    hearth_detail::expected<resilience::BreakerConfig, std::string>
    parse_breaker(const nlohmann::json& s, std::string_view path, resilience::BreakerConfig base) {
        auto threshold = read_number<uint32_t>(s, path, "failure_threshold", base.failure_threshold,
                                               BREAKER_FAILURE_THRESHOLD_MIN, BREAKER_FAILURE_THRESHOLD_MAX);
        if (!threshold) return Err(threshold.error());
        auto recovery = read_number<uint32_t>(s, path, "recovery_timeout_ms", base.recovery_timeout_ms,
                                              BREAKER_RECOVERY_TIMEOUT_MS_MIN, BREAKER_RECOVERY_TIMEOUT_MS_MAX);
        if (!recovery) return Err(recovery.error());
        auto probes = read_number<uint32_t>(s, path, "half_open_max_probes", base.half_open_max_probes,
                                            1u, BREAKER_HALF_OPEN_PROBES_MAX);
        if (!probes) return Err(probes.error());
        return resilience::BreakerConfig{*threshold, *recovery, *probes};
    }

    nlohmann::json breaker_json(const resilience::BreakerConfig& b) {
        return {{"failure_threshold", b.failure_threshold},
                {"recovery_timeout_ms", b.recovery_timeout_ms},
                {"half_open_max_probes", b.half_open_max_probes}};
    }

    } // namespace

    nlohmann::json RuntimeConfig::to_json() const {
        nlohmann::json retry = http.retry.to_json();
        retry.erase("total_backoff_ms");

        nlohmann::json overrides = nlohmann::json::object();
        for (const auto& [dep, b] : breaker_overrides) overrides[dep] = breaker_json(b);
        nlohmann::json breaker_doc = breaker_json(breaker);
        breaker_doc["overrides"] = std::move(overrides);

        return {{"retry", std::move(retry)},
                {"http", {{"rate_limit_per_window", http.rate.ceiling},
                          {"window_ms", http.rate.window_ms},
                          {"timeout_ms", http.timeout.count()}}},
                {"websocket", {{"rate_limit_per_window", websocket.rate.ceiling},
                               {"window_ms", websocket.rate.window_ms},
                               {"timeout_s", websocket.default_timeout_s},
                               {"max_connections", websocket.max_connections},
                               {"max_message_bytes", websocket.max_message_bytes},
                               {"allow_private_hosts", websocket.allow_private_hosts}}},
                {"circuit_breaker", std::move(breaker_doc)},
                {"cache", {{"default_ttl_s", cache_settings.default_ttl_s},
                           {"max_ttl_s", cache_settings.max_ttl_s},
                           {"max_bytes", cache_settings.max_bytes},
                           {"cleanup_mark", cache_settings.cleanup_mark},
                           {"evict_mark", cache_settings.evict_mark},
                           {"critical_mark", cache_settings.critical_mark},
                           {"emergency_mark", cache_settings.emergency_mark},
                           {"critical_target", cache_settings.critical_target},
                           {"host_memory_limit_mb", host_memory_limit_mb}}},
                {"logging", {{"level", log_level}}}};
    }

    RuntimeConfig Loader::defaults() {
        RuntimeConfig rc;
        rc.document = rc.to_json();
        return rc;
    }

    hearth_detail::expected<RuntimeConfig, std::string> Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) return Err("cannot open config file '" + path + "'");
        nlohmann::json doc = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/true);
        if (doc.is_discarded()) return Err("config file '" + path + "' is not valid JSON");
        return load_from_json(doc);
    }

    hearth_detail::expected<RuntimeConfig, std::string> Loader::load_from_json(const nlohmann::json& doc) {
        if (!doc.is_object()) return Err(std::string("configuration root must be an object"));
        RuntimeConfig rc;

        // ---- retry (shared by both clients) ----
        auto retry_doc = section_of(doc, "retry");
        if (!retry_doc) return Err(retry_doc.error());
        auto retry = net::retry_policy_from_json(*retry_doc);
        if (!retry) return Err("retry: " + retry.error());
        rc.http.retry = *retry;
        rc.websocket.retry = *retry;

        // ---- http ----
        auto http = section_of(doc, "http");
        if (!http) return Err(http.error());
        auto http_ceiling = read_number<uint32_t>(*http, "http", "rate_limit_per_window", RATE_LIMIT_HTTP_CEILING,
                                                  1u, RATE_LIMIT_CEILING_MAX);
        if (!http_ceiling) return Err(http_ceiling.error());
        auto http_window = read_number<uint32_t>(*http, "http", "window_ms", RATE_LIMIT_WINDOW_MS, 1u, 60000u);
        if (!http_window) return Err(http_window.error());
        auto http_timeout = read_number<uint32_t>(*http, "http", "timeout_ms", HTTP_TIMEOUT_MS, 1u, HTTP_TIMEOUT_MS_MAX);
        if (!http_timeout) return Err(http_timeout.error());
        rc.http.rate = {*http_ceiling, *http_window};
        rc.http.timeout = std::chrono::milliseconds(*http_timeout);

        // ---- websocket ----
        auto ws = section_of(doc, "websocket");
        if (!ws) return Err(ws.error());
        auto ws_ceiling = read_number<uint32_t>(*ws, "websocket", "rate_limit_per_window",
                                                RATE_LIMIT_WEBSOCKET_CEILING, 1u, RATE_LIMIT_CEILING_MAX);
        if (!ws_ceiling) return Err(ws_ceiling.error());
        auto ws_window = read_number<uint32_t>(*ws, "websocket", "window_ms", RATE_LIMIT_WINDOW_MS, 1u, 60000u);
        if (!ws_window) return Err(ws_window.error());
        auto ws_timeout = read_number<uint32_t>(*ws, "websocket", "timeout_s", WEBSOCKET_TIMEOUT_S,
                                                WEBSOCKET_TIMEOUT_S_MIN, WEBSOCKET_TIMEOUT_S_MAX);
        if (!ws_timeout) return Err(ws_timeout.error());
        auto ws_max_conn = read_number<std::size_t>(*ws, "websocket", "max_connections",
                                                    WEBSOCKET_MAX_OPEN_CONNECTIONS, 1u, 64u);
        if (!ws_max_conn) return Err(ws_max_conn.error());
        auto ws_max_msg = read_number<std::size_t>(*ws, "websocket", "max_message_bytes",
                                                   WEBSOCKET_MAX_MESSAGE_BYTES, 1u, WEBSOCKET_MAX_MESSAGE_BYTES);
        if (!ws_max_msg) return Err(ws_max_msg.error());
        auto ws_private = read_bool(*ws, "websocket", "allow_private_hosts", false);
        if (!ws_private) return Err(ws_private.error());
        rc.websocket.rate = {*ws_ceiling, *ws_window};
        rc.websocket.default_timeout_s = *ws_timeout;
        rc.websocket.max_connections = *ws_max_conn;
        rc.websocket.max_message_bytes = *ws_max_msg;
        rc.websocket.allow_private_hosts = *ws_private;

        // ---- circuit breaker ----
        auto cb = section_of(doc, "circuit_breaker");
        if (!cb) return Err(cb.error());
        auto breaker = parse_breaker(*cb, "circuit_breaker", resilience::BreakerConfig{});
        if (!breaker) return Err(breaker.error());
        rc.breaker = *breaker;
        auto overrides = section_of(*cb, "overrides");
        if (!overrides) return Err("circuit_breaker." + overrides.error());
        for (auto it = overrides->begin(); it != overrides->end(); ++it) {
            if (!it.value().is_object()) return Err("circuit_breaker.overrides." + it.key() + " must be an object");
            auto ov = parse_breaker(it.value(), "circuit_breaker.overrides." + it.key(), rc.breaker);
            if (!ov) return Err(ov.error());
            rc.breaker_overrides.emplace(it.key(), *ov);
        }

        // ---- cache ----
        auto cache = section_of(doc, "cache");
        if (!cache) return Err(cache.error());
        auto max_ttl = read_number<int32_t>(*cache, "cache", "max_ttl_s", CACHE_MAX_TTL_S, 1, 7 * 24 * 3600);
        if (!max_ttl) return Err(max_ttl.error());
        auto default_ttl = read_number<int32_t>(*cache, "cache", "default_ttl_s", CACHE_DEFAULT_TTL_S, 1, *max_ttl);
        if (!default_ttl) return Err(default_ttl.error());
        auto max_bytes = read_number<std::size_t>(*cache, "cache", "max_bytes", CACHE_MAX_BYTES,
                                                  std::size_t{4096}, std::size_t{1} << 30);
        if (!max_bytes) return Err(max_bytes.error());
        auto host_mb = read_number<std::size_t>(*cache, "cache", "host_memory_limit_mb", HOST_MEMORY_LIMIT_MB,
                                                std::size_t{0}, std::size_t{1} << 20);
        if (!host_mb) return Err(host_mb.error());
        rc.cache_settings.max_ttl_s = *max_ttl;
        rc.cache_settings.default_ttl_s = *default_ttl;
        rc.cache_settings.max_bytes = *max_bytes;
        rc.host_memory_limit_mb = *host_mb;

        // Pressure stages: fractions in (0, 1], strictly ascending; the critical target sits
        // at or below the cleanup mark.
        struct Mark {
            const char* key;
            double      fallback;
            double*     out;
        };
        const Mark marks[] = {
            {"cleanup_mark", CACHE_PRESSURE_CLEANUP, &rc.cache_settings.cleanup_mark},
            {"evict_mark", CACHE_PRESSURE_EVICT, &rc.cache_settings.evict_mark},
            {"critical_mark", CACHE_PRESSURE_CRITICAL, &rc.cache_settings.critical_mark},
            {"emergency_mark", CACHE_PRESSURE_EMERGENCY, &rc.cache_settings.emergency_mark},
        };
        const Mark* previous = nullptr;
        for (const auto& m : marks) {
            auto v = read_number<double>(*cache, "cache", m.key, m.fallback, CACHE_PRESSURE_MARK_MIN, 1.0);
            if (!v) return Err(v.error());
            if (previous && !(*v > *previous->out)) {
                return Err(std::string("cache.") + m.key + " must be greater than cache." + previous->key);
            }
            *m.out = *v;
            previous = &m;
        }
        auto target = read_number<double>(*cache, "cache", "critical_target", CACHE_CRITICAL_TARGET,
                                          CACHE_PRESSURE_MARK_MIN, 1.0);
        if (!target) return Err(target.error());
        if (*target > rc.cache_settings.cleanup_mark) {
            return Err(std::string("cache.critical_target must not exceed cache.cleanup_mark"));
        }
        rc.cache_settings.critical_target = *target;

        // ---- logging ----
        auto logging = section_of(doc, "logging");
        if (!logging) return Err(logging.error());
        if (logging->contains("level")) {
            const auto& lvl = logging->at("level");
            if (!lvl.is_string()) return Err(std::string("logging.level must be a string"));
            const std::string name = lvl.get<std::string>();
            if (spdlog::level::from_str(name) == spdlog::level::off && name != "off") {
                return Err("logging.level '" + name + "' is not a known level");
            }
            rc.log_level = name;
        }

        // Effective values win; unrelated sections of the document stay visible to config.get.
        rc.document = doc;
        rc.document.merge_patch(rc.to_json());
        return rc;
    }

    std::optional<nlohmann::json> JsonConfigProvider::get(std::string_view key) const {
        if (key.empty()) return std::nullopt;
        const nlohmann::json* node = &doc_;
        std::size_t start = 0;
        while (start <= key.size()) {
            const auto dot = key.find('.', start);
            const std::string part(key.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start));
            if (!node->is_object() || !node->contains(part)) return std::nullopt;
            node = &node->at(part);
            if (dot == std::string_view::npos) break;
            start = dot + 1;
        }
        return *node;
    }

} // namespace hearth::config
