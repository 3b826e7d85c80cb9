#ifndef HEARTH_VERSION_HPP
#define HEARTH_VERSION_HPP

#pragma once

namespace hearth {

    /// Project semantic version components
    inline constexpr int version_major = 0;
    inline constexpr int version_minor = 3;
    inline constexpr int version_patch = 0;

    /// Combined version string (e.g. "0.3.0")
    inline constexpr const char* version_string = "0.3.0";

    /// User-Agent sent on outbound HTTP requests
    inline constexpr const char* user_agent = "hearth-gateway/0.3.0";

} // namespace hearth

#endif // HEARTH_VERSION_HPP
