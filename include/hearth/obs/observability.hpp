#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade: structured event logging + metrics sink.
 * @details Events are emitted as one JSON line per record through spdlog. Values under
 *          secret-looking keys are redacted before formatting so tokens never reach a sink.
 */

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

namespace hearth::obs {

    /// True if @p key names secret material (token, authorization, password, ...).
    bool is_secret_key(std::string_view key);

    /// Deep copy of @p fields with every secret-keyed value replaced by "***".
    nlohmann::json redact(const nlohmann::json& fields);

    /** @class EventLogger
     *  @brief Structured logger: correlation id + event tag + message + redacted fields.
     */
    class EventLogger {
    public:
        explicit EventLogger(std::shared_ptr<spdlog::logger> backend);

        void log_debug(std::string_view correlation_id, std::string_view tag,
                       std::string_view message, const nlohmann::json& fields = nullptr) const;
        void log_info(std::string_view correlation_id, std::string_view tag,
                      std::string_view message, const nlohmann::json& fields = nullptr) const;
        void log_warn(std::string_view correlation_id, std::string_view tag,
                      std::string_view message, const nlohmann::json& fields = nullptr) const;
        void log_error(std::string_view correlation_id, std::string_view tag,
                       std::string_view message, const nlohmann::json& fields = nullptr) const;

        /// Underlying spdlog logger (level control, flushing).
        spdlog::logger& backend() noexcept { return *backend_; }

    private:
        void emit(spdlog::level::level_enum lvl, std::string_view correlation_id, std::string_view tag,
                  std::string_view message, const nlohmann::json& fields) const;

        std::shared_ptr<spdlog::logger> backend_;
    };

    /// Process-wide logger writing to stderr (name "hearth", level info).
    std::shared_ptr<EventLogger> default_logger();

    /// Logger that discards everything.
    std::shared_ptr<EventLogger> null_logger();

    /** @struct MetricPoint
     *  @brief Aggregate of every value recorded under one metric name.
     */
    struct MetricPoint {
        uint64_t    count{0}; ///< Number of records
        double      sum{0.0}; ///< Sum of recorded values
        double      last{0.0};///< Most recent value
        std::string unit;     ///< Unit of the most recent record
    };

    /** @class MetricsSink
     *  @brief Metrics capability consumed by components.
     */
    class MetricsSink {
    public:
        virtual ~MetricsSink() = default;
        /// Record a single sample.
        virtual void record(std::string_view name, double value, std::string_view unit = "count") = 0;
    };

    /** @class InMemoryMetrics
     *  @brief Aggregating sink with snapshot access.
     */
    class InMemoryMetrics final : public MetricsSink {
    public:
        void record(std::string_view name, double value, std::string_view unit = "count") override;

        /// Copy of every aggregate, ordered by name.
        std::map<std::string, MetricPoint> snapshot() const;

        /// Sum recorded under @p name (0 if never recorded).
        double sum(std::string_view name) const;

        /// Snapshot as {name: {count, sum, last, unit}}.
        nlohmann::json to_json() const;

    private:
        mutable std::mutex mu_;
        std::map<std::string, MetricPoint, std::less<>> points_;
    };

} // namespace hearth::obs
