#pragma once
/**
 * @file expected.hpp
 * @brief hearth_detail::expected / unexpected: value-or-error returns for hearth's fallible steps.
 *
 * URL parsing, config loading, target validation and transport calls return
 * `hearth_detail::expected<T, E>` instead of throwing; callers branch on the result and
 * fold the error into an OperationResult. The alias resolves to std::expected when the
 * library advertises `__cpp_lib_expected` (202211L or newer) and to tl::expected otherwise,
 * so both spellings never mix inside one build.
 */

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
#include <expected>

namespace hearth_detail {
    template <class T, class E> using expected   = std::expected<T, E>;
    template <class E>          using unexpected = std::unexpected<E>;
} // namespace hearth_detail
#else
#include <tl/expected.hpp>

namespace hearth_detail {
    template <class T, class E> using expected   = tl::expected<T, E>;
    template <class E>          using unexpected = tl::unexpected<E>;
} // namespace hearth_detail
#endif
