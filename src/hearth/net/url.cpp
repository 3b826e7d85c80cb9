/**
 * @file url.cpp
 * @brief Absolute http(s)/ws(s) URL parsing, host:port dependency keys and private-address checks.
 */
#include "hearth/net/url.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstring>

#include <arpa/inet.h>

namespace hearth::net {

    namespace {

    std::string lower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    uint16_t default_port(std::string_view scheme) noexcept {
        return (scheme == "https" || scheme == "wss") ? 443 : 80;
    }

    bool ends_with(std::string_view s, std::string_view suffix) noexcept {
        return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
    }

    } // namespace

    std::string Url::dependency() const {
        return host + ":" + std::to_string(port);
    }

    std::string Url::host_header() const {
        const std::string h = (host.find(':') != std::string::npos) ? "[" + host + "]" : host;
        if (port == default_port(scheme)) return h;
        return h + ":" + std::to_string(port);
    }

    hearth_detail::expected<Url, std::string> parse_url(std::string_view text) {
        using Err = hearth_detail::unexpected<std::string>;

        const auto sep = text.find("://");
        if (sep == std::string_view::npos || sep == 0) return Err(std::string("missing scheme"));

        Url u;
        u.scheme = lower(text.substr(0, sep));
        if (u.scheme != "http" && u.scheme != "https" && u.scheme != "ws" && u.scheme != "wss") {
            return Err("unsupported scheme '" + u.scheme + "'");
        }

        std::string_view rest = text.substr(sep + 3);
        const auto auth_end = rest.find_first_of("/?#");
        std::string_view authority = rest.substr(0, auth_end);
        std::string_view tail = (auth_end == std::string_view::npos) ? std::string_view{} : rest.substr(auth_end);

        if (authority.find('@') != std::string_view::npos) {
            return Err(std::string("credentials in URL are not accepted"));
        }
        if (authority.empty()) return Err(std::string("missing host"));

        std::string_view host_part;
        std::string_view port_part;
        if (authority.front() == '[') {
            const auto close = authority.find(']');
            if (close == std::string_view::npos) return Err(std::string("unterminated IPv6 literal"));
            host_part = authority.substr(1, close - 1);
            std::string_view after = authority.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':') return Err(std::string("malformed authority"));
                port_part = after.substr(1);
            }
        } else {
            const auto colon = authority.rfind(':');
            host_part = authority.substr(0, colon);
            if (colon != std::string_view::npos) port_part = authority.substr(colon + 1);
        }
        if (host_part.empty()) return Err(std::string("missing host"));
        u.host = lower(host_part);

        if (port_part.empty()) {
            u.port = default_port(u.scheme);
        } else {
            unsigned value = 0;
            const auto* first = port_part.data();
            const auto* last = port_part.data() + port_part.size();
            const auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec != std::errc{} || ptr != last || value == 0 || value > 65535) {
                return Err("invalid port '" + std::string(port_part) + "'");
            }
            u.port = static_cast<uint16_t>(value);
        }

        if (const auto hash = tail.find('#'); hash != std::string_view::npos) tail = tail.substr(0, hash);
        if (tail.empty()) {
            u.target = "/";
        } else if (tail.front() == '?') {
            u.target = "/" + std::string(tail);
        } else {
            u.target = std::string(tail);
        }
        return u;
    }

    bool is_private_host(std::string_view host) {
        const std::string h = lower(host);
        if (h == "localhost" || ends_with(h, ".localhost")) return true;

        unsigned char buf[16];
        if (inet_pton(AF_INET, h.c_str(), buf) == 1) {
            const unsigned a = buf[0], b = buf[1];
            if (a == 0) return true;                          // 0.0.0.0/8
            if (a == 10) return true;                         // 10/8
            if (a == 127) return true;                        // loopback
            if (a == 169 && b == 254) return true;            // link-local, cloud metadata
            if (a == 172 && b >= 16 && b <= 31) return true;  // 172.16/12
            if (a == 192 && b == 168) return true;            // 192.168/16
            return false;
        }
        if (inet_pton(AF_INET6, h.c_str(), buf) == 1) {
            static constexpr std::array<unsigned char, 16> kZero{};
            static constexpr std::array<unsigned char, 16> kLoop{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1};
            if (std::memcmp(buf, kZero.data(), 16) == 0) return true;  // ::
            if (std::memcmp(buf, kLoop.data(), 16) == 0) return true;  // ::1
            if ((buf[0] & 0xfe) == 0xfc) return true;                  // fc00::/7
            if (buf[0] == 0xfe && (buf[1] & 0xc0) == 0x80) return true; // fe80::/10
            // IPv4-mapped ::ffff:a.b.c.d
            static constexpr std::array<unsigned char, 12> kMapped{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff};
            if (std::memcmp(buf, kMapped.data(), 12) == 0) {
                char v4[INET_ADDRSTRLEN];
                if (inet_ntop(AF_INET, buf + 12, v4, sizeof(v4)) != nullptr) return is_private_host(v4);
            }
            return false;
        }
        return false;
    }

} // namespace hearth::net
