#pragma once
/**
 * @file url.hpp
 * @brief Minimal absolute-URL parsing for http/https/ws/wss targets.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include "hearth/compat/expected.hpp"

namespace hearth::net {

    /** @struct Url
     *  @brief Parsed absolute URL. `target` is path + query ("/" when empty).
     */
    struct Url {
        std::string scheme;   ///< Lower-case: http, https, ws, wss
        std::string host;     ///< Without IPv6 brackets
        uint16_t    port{0};  ///< Explicit or scheme default
        std::string target;

        /// https or wss.
        [[nodiscard]] bool tls() const noexcept { return scheme == "https" || scheme == "wss"; }

        /// Circuit breaker dependency name: "host:port".
        [[nodiscard]] std::string dependency() const;

        /// Value for the Host header (port omitted when it is the scheme default).
        [[nodiscard]] std::string host_header() const;
    };

    /// Parse an absolute URL. Error string names the defect.
    hearth_detail::expected<Url, std::string> parse_url(std::string_view text);

    /**
     * @brief True for loopback, private, link-local and unspecified literals and for
     *        "localhost" names (IPv4 and IPv6).
     * @note Hostnames are not resolved; only literals and localhost names are classified.
     */
    bool is_private_host(std::string_view host);

} // namespace hearth::net
