/**
 * @file error.hpp
 * @brief std::expected error payload shared by the minimisers + Jacobian helper uwu
 *
 * algorithm entry points never throw for "this function cannot be minimised";
 * they return std::expected with this error struct so callers can tell a bad
 * call (InvalidArgument) apart from a function the heuristics cannot certify
 * (PoorlyConditioned) and decide their own retry policy. context strings form
 * a breadcrumb trail (e.g. {"find_powell", "iteration 3", "find_bracket"}).
 *
 * value types (Vector, Matrix, Bracket, ...) keep using exceptions for broken
 * preconditions; those are programming errors, not outcomes.
 */
#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace mcm
{

/**
 * @brief which kind of failure an algorithm reported
 */
enum class ErrorKind : std::uint8_t
{
    InvalidArgument   = 0U, ///< the call itself was malformed; nothing was attempted
    PoorlyConditioned = 1U  ///< no minimum could be certified within bounded effort
};

/**
 * @brief error payload with context breadcrumbs for days
 */
struct Error
{
    ErrorKind                kind;    ///< invalid argument vs poorly conditioned
    std::string              message; ///< human-readable summary of what went sideways
    std::vector<std::string> context; ///< breadcrumb trail, outermost call first
};

/**
 * @brief convenience alias for algorithm results (std::expected wrapper)
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief fabricate an unexpected Error without the std::unexpected boilerplate
 */
[[nodiscard]] inline auto make_error(ErrorKind kind, std::string message, std::vector<std::string> context = {})
    -> std::unexpected<Error>
{
    return std::unexpected(Error{kind, std::move(message), std::move(context)});
}

/**
 * @brief push an outer breadcrumb onto an error travelling up the call stack
 */
[[nodiscard]] inline auto with_context(Error error, std::string outer) -> std::unexpected<Error>
{
    error.context.insert(error.context.begin(), std::move(outer));
    return std::unexpected(std::move(error));
}

[[nodiscard]] inline auto is_poorly_conditioned(const Error &error) noexcept -> bool
{
    return error.kind == ErrorKind::PoorlyConditioned;
}

/**
 * @brief one-line rendering "kind: message [a > b > c]" for logs and test output
 */
[[nodiscard]] auto describe(const Error &error) -> std::string;

} // namespace mcm
