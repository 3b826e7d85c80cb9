#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: parse a JSON document into RuntimeConfig; missing keys keep the
 *        named defaults from constants.hpp, out-of-range values are rejected.
 */

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "hearth/cache/ttl_cache.hpp"
#include "hearth/compat/expected.hpp"
#include "hearth/config/constants.hpp"
#include "hearth/net/http_client.hpp"
#include "hearth/net/ws_client.hpp"
#include "hearth/resilience/circuit_breaker.hpp"

namespace hearth::config {

    /** @struct RuntimeConfig
     *  @brief Aggregate of sub-configs required by the gateway and its components.
     */
    struct RuntimeConfig {
        net::HttpClientConfig                            http;              ///< Retry policy, limiter, timeout
        net::WsClientConfig                              websocket;         ///< Limiter, timeouts, connection table
        resilience::BreakerConfig                        breaker;           ///< Default for every dependency
        std::map<std::string, resilience::BreakerConfig> breaker_overrides; ///< Per-dependency configs
        cache::CacheConfig                               cache_settings;    ///< TTLs and byte budget
        std::size_t host_memory_limit_mb{constants::HOST_MEMORY_LIMIT_MB};  ///< 0 disables the host gauge
        std::string log_level{"info"};                                      ///< spdlog level name
        nlohmann::json document = nlohmann::json::object();                 ///< Effective configuration

        /// Effective values as JSON (same layout as the accepted document).
        nlohmann::json to_json() const;
    };

    /** @class Loader
     *  @brief Source of runtime configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// Named defaults only.
        static RuntimeConfig defaults();

        /**
         * @brief Read and parse @p path.
         * @return RuntimeConfig, or a message naming the file or the offending key.
         */
        static hearth_detail::expected<RuntimeConfig, std::string> load_from_file(const std::string& path);

        /// Parse an already-decoded document.
        static hearth_detail::expected<RuntimeConfig, std::string> load_from_json(const nlohmann::json& doc);
    };

    /** @class ConfigProvider
     *  @brief Read access to configuration values by key.
     */
    class ConfigProvider {
    public:
        virtual ~ConfigProvider() = default;
        /// Value under @p key, or nullopt if absent.
        virtual std::optional<nlohmann::json> get(std::string_view key) const = 0;
    };

    /** @class JsonConfigProvider
     *  @brief Dotted-path lookup ("retry.max_attempts") into a JSON document.
     */
    class JsonConfigProvider final : public ConfigProvider {
    public:
        explicit JsonConfigProvider(nlohmann::json document) : doc_(std::move(document)) {}

        std::optional<nlohmann::json> get(std::string_view key) const override;

    private:
        nlohmann::json doc_;
    };

} // namespace hearth::config
