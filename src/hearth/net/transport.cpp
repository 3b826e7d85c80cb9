/**
 * @file transport.cpp
 * @brief TransportErrc names and the case-insensitive header ordering.
 */
#include "hearth/net/transport.hpp"

#include <algorithm>
#include <cctype>

namespace hearth::net {

    std::string_view to_string(TransportErrc e) noexcept {
        switch (e) {
            case TransportErrc::Connection: return "connection";
            case TransportErrc::Timeout:    return "timeout";
            case TransportErrc::Protocol:   return "protocol";
        }
        return "unknown";
    }

    bool HeaderLess::operator()(std::string_view a, std::string_view b) const noexcept {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
                                            [](unsigned char x, unsigned char y) {
                                                return std::tolower(x) < std::tolower(y);
                                            });
    }

} // namespace hearth::net
