/**
 * @file log.hpp
 * @brief opt-in trace lines for the iterative solvers
 *
 * ⚠️ IMPURE (writes to stdout when enabled)
 *
 * the minimisers are silent by default. when the caller flips
 * config::MinimiserSettings::trace, each iteration prints a breadcrumb
 * prefixed with the module tag so runs can be grepped without attaching a
 * debugger. nothing here holds global state; the flag travels with the call.
 */
#pragma once

#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace mcm::common
{

inline constexpr std::string_view kMin1LogTag  = "[mcm::min1]";
inline constexpr std::string_view kMinNLogTag  = "[mcm::minn]";
inline constexpr std::string_view kFieldLogTag = "[mcm::field]";

/**
 * @brief print "<tag> <formatted message>" to stdout when enabled is true
 *
 * @tparam Args formatting argument pack forwarded to fmt::format
 *
 * @param[in] enabled caller's trace switch; false makes this a no-op
 * @param[in] tag module prefix (one of the kXxxLogTag constants)
 * @param[in] format fmtlib-style format string
 * @param[in] args arguments that satisfy the format string requirements
 */
template <typename... Args>
void log_trace(bool enabled, std::string_view tag, fmt::format_string<Args...> format, Args &&...args)
{
    if (!enabled)
    {
        return;
    }
    fmt::print("{} {}\n", tag, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace mcm::common
