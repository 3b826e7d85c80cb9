/**
 * @file observability.cpp
 * @brief spdlog-backed EventLogger and in-memory metrics aggregation.
 */
#include "hearth/obs/observability.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace hearth::obs {

    namespace {

    constexpr std::array<std::string_view, 8> kSecretMarkers = {
        "token", "authorization", "password", "secret", "api_key", "apikey", "credential", "cookie"};

    std::string lower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    } // namespace

    bool is_secret_key(std::string_view key) {
        const std::string k = lower(key);
        for (auto marker : kSecretMarkers) {
            if (k.find(marker) != std::string::npos) return true;
        }
        return false;
    }

    nlohmann::json redact(const nlohmann::json& fields) {
        if (fields.is_object()) {
            nlohmann::json out = nlohmann::json::object();
            for (auto it = fields.begin(); it != fields.end(); ++it) {
                out[it.key()] = is_secret_key(it.key()) ? nlohmann::json("***") : redact(it.value());
            }
            return out;
        }
        if (fields.is_array()) {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& v : fields) out.push_back(redact(v));
            return out;
        }
        return fields;
    }

    // ---------------------------------------------------------------------------
    // EventLogger
    // ---------------------------------------------------------------------------

    EventLogger::EventLogger(std::shared_ptr<spdlog::logger> backend)
        : backend_(std::move(backend)) {}

    void EventLogger::emit(spdlog::level::level_enum lvl, std::string_view correlation_id,
                           std::string_view tag, std::string_view message,
                           const nlohmann::json& fields) const {
        if (!backend_->should_log(lvl)) return;

        nlohmann::json line = nlohmann::json::object();
        line["cid"] = std::string(correlation_id);
        line["tag"] = std::string(tag);
        line["msg"] = std::string(message);
        if (fields.is_object()) {
            const nlohmann::json safe = redact(fields);
            for (auto it = safe.begin(); it != safe.end(); ++it) line[it.key()] = it.value();
        } else if (!fields.is_null()) {
            line["fields"] = redact(fields);
        }
        backend_->log(lvl, line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    void EventLogger::log_debug(std::string_view cid, std::string_view tag, std::string_view msg,
                                const nlohmann::json& fields) const {
        emit(spdlog::level::debug, cid, tag, msg, fields);
    }

    void EventLogger::log_info(std::string_view cid, std::string_view tag, std::string_view msg,
                               const nlohmann::json& fields) const {
        emit(spdlog::level::info, cid, tag, msg, fields);
    }

    void EventLogger::log_warn(std::string_view cid, std::string_view tag, std::string_view msg,
                               const nlohmann::json& fields) const {
        emit(spdlog::level::warn, cid, tag, msg, fields);
    }

    void EventLogger::log_error(std::string_view cid, std::string_view tag, std::string_view msg,
                                const nlohmann::json& fields) const {
        emit(spdlog::level::err, cid, tag, msg, fields);
    }

    std::shared_ptr<EventLogger> default_logger() {
        static const std::shared_ptr<EventLogger> inst = [] {
            auto sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
            auto lg = std::make_shared<spdlog::logger>("hearth", std::move(sink));
            lg->set_pattern("[%Y-%m-%dT%H:%M:%S.%e] [%l] %v");
            lg->set_level(spdlog::level::info);
            lg->flush_on(spdlog::level::warn);
            return std::make_shared<EventLogger>(std::move(lg));
        }();
        return inst;
    }

    std::shared_ptr<EventLogger> null_logger() {
        static const std::shared_ptr<EventLogger> inst = std::make_shared<EventLogger>(
            std::make_shared<spdlog::logger>("hearth-null", std::make_shared<spdlog::sinks::null_sink_mt>()));
        return inst;
    }

    // ---------------------------------------------------------------------------
    // InMemoryMetrics
    // ---------------------------------------------------------------------------

    void InMemoryMetrics::record(std::string_view name, double value, std::string_view unit) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = points_.find(name);
        if (it == points_.end()) it = points_.emplace(std::string(name), MetricPoint{}).first;
        auto& p = it->second;
        p.count++;
        p.sum += value;
        p.last = value;
        p.unit = std::string(unit);
    }

    std::map<std::string, MetricPoint> InMemoryMetrics::snapshot() const {
        std::lock_guard<std::mutex> lk(mu_);
        return std::map<std::string, MetricPoint>(points_.begin(), points_.end());
    }

    double InMemoryMetrics::sum(std::string_view name) const {
        std::lock_guard<std::mutex> lk(mu_);
        const auto it = points_.find(name);
        return it == points_.end() ? 0.0 : it->second.sum;
    }

    nlohmann::json InMemoryMetrics::to_json() const {
        nlohmann::json out = nlohmann::json::object();
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& [name, p] : points_) {
            out[name] = {{"count", p.count}, {"sum", p.sum}, {"last", p.last}, {"unit", p.unit}};
        }
        return out;
    }

} // namespace hearth::obs
