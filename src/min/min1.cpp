/**
 * @file min1.cpp
 * @brief bracket search + Brent's method
 */
#include "mcm/min/min1.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <utility>

#include <fmt/core.h>

#include "mcm/common/log.hpp"

namespace mcm::min
{
namespace
{

/// parabolic extrapolation may reach at most this many current steps ahead
constexpr double kMaxStep = 100.0;

/// absolute floor of the Brent x tolerance (so minima at x == 0 still converge)
constexpr double kAbsoluteXTolerance = common::kUlpOne * 1.0e-3;

[[nodiscard]] auto poorly_conditioned(std::string message, const char *operation) -> std::unexpected<Error>
{
    return make_error(ErrorKind::PoorlyConditioned, std::move(message), {operation});
}

/// f(x), refusing abscissas that overflowed and values that are NaN
[[nodiscard]] auto sample(const Function1 &f, double x) -> Result<Function1Value>
{
    if (!std::isfinite(x))
    {
        return make_error(ErrorKind::PoorlyConditioned, fmt::format("abscissa overflowed to {}", x));
    }
    const double value = f(x);
    if (std::isnan(value))
    {
        return make_error(ErrorKind::PoorlyConditioned, fmt::format("f is NaN at {}", x));
    }
    return Function1Value{x, value};
}

/**
 * @brief p2 + r (p2 - p1), starting at r = golden ratio and halving r while f is NaN
 */
[[nodiscard]] auto step_further(const Function1 &f, const Function1Value &p1, const Function1Value &p2)
    -> Result<Function1Value>
{
    const double x2 = p2.x;
    const double dx = x2 - p1.x;
    double       r  = common::kGolden;
    double       x_new{};
    double       f_new{};
    do
    {
        x_new = x2 + (r * dx);
        if (!std::isfinite(x_new))
        {
            return make_error(ErrorKind::PoorlyConditioned, fmt::format("abscissa overflowed stepping from {}", x2));
        }
        f_new = f(x_new);
        r *= 0.5;
    } while (std::isnan(f_new) && 0.0 < r && x_new != x2);

    if (x_new == x2)
    {
        return make_error(ErrorKind::PoorlyConditioned, fmt::format("step from {} stalled in floating point", x2));
    }
    if (std::isnan(f_new))
    {
        return make_error(ErrorKind::PoorlyConditioned, fmt::format("f is NaN beyond {}", x2));
    }
    return Function1Value{x_new, f_new};
}

/// abscissa of the vertex of the parabola through three points
[[nodiscard]] auto parabolic_extrapolation(const Function1Value &p1, const Function1Value &p2,
                                           const Function1Value &p3) noexcept -> double
{
    const double x21    = p2.x - p1.x;
    const double x23    = p2.x - p3.x;
    const double y23    = p2.f - p3.f;
    const double y21    = p2.f - p1.f;
    const double x21y23 = x21 * y23;
    const double x23y21 = x23 * y21;
    return p2.x - (((x21 * x21y23) - (x23 * x23y21)) / (2.0 * (x21y23 - x23y21)));
}

/// golden-section probe into the larger of the two intervals either side of x2
[[nodiscard]] auto golden_section(double x1, double x2, double x3) noexcept -> double
{
    const double x21 = x2 - x1;
    const double x32 = x3 - x2;
    if (x21 <= x32)
    {
        return x2 + ((2.0 - common::kGolden) * x32);
    }
    return x2 - ((2.0 - common::kGolden) * x21);
}

/// x2 strictly between x1 and x3 (either order)
[[nodiscard]] auto is_between(double x1, double x2, double x3) noexcept -> bool
{
    if (x1 < x3)
    {
        return x1 < x2 && x2 < x3;
    }
    return x3 < x2 && x2 < x1;
}

/// x3 lies past x2 when walking from x1 towards x2
[[nodiscard]] auto is_beyond(double x1, double x2, double x3) noexcept -> bool
{
    if (x1 < x2)
    {
        return x2 < x3;
    }
    return x3 < x2;
}

/**
 * @brief Brent's loop, shared by the value-only and derivative-carrying overloads
 *
 * only the current best point is kept as the caller's point type P (so the
 * derivative there survives); every other point is a plain Function1Value.
 */
template <typename P, typename Evaluate>
[[nodiscard]] auto brent(Evaluate evaluate, const Bracket &bracket, P inner, double tolerance,
                         const config::MinimiserSettings &settings) -> Result<P>
{
    const auto demote = [](const auto &p) { return Function1Value{p.x, p.f}; };

    Function1Value left  = bracket.left();
    Function1Value right = bracket.right();
    Function1Value second_least{};
    Function1Value previous_second_least{};
    if (left.f < right.f)
    {
        second_least          = left;
        previous_second_least = right;
    }
    else
    {
        second_least          = right;
        previous_second_least = left;
    }

    double width = right.x - left.x;
    // recent step lengths, seeded with golden-section guesses
    double dx2 = width * (common::kGolden - 1.0);
    double dx3 = dx2 * common::kGolden;

    for (std::uint32_t iteration = 0;; ++iteration)
    {
        const double x_tolerance = std::max(std::abs(inner.x) * tolerance, kAbsoluteXTolerance);
        if (width <= x_tolerance * 2.0)
        {
            common::log_trace(settings.trace, common::kMin1LogTag, "find_brent converged at x={} f={} after {} steps",
                              inner.x, inner.f, iteration);
            return inner;
        }
        if (iteration >= settings.max_brent_iterations)
        {
            common::log_trace(settings.trace, common::kMin1LogTag, "find_brent gave up with width {}", width);
            return poorly_conditioned(
                fmt::format("bracket width {} still above {} after {} iterations", width, x_tolerance * 2.0, iteration),
                "find_brent");
        }

        double x_new{};
        if (x_tolerance < std::abs(dx3))
        {
            x_new = parabolic_extrapolation(demote(inner), second_least, previous_second_least);
            if (!std::isfinite(x_new) || x_new <= left.x || right.x <= x_new ||
                std::abs(dx3) * 0.5 <= std::abs(x_new - inner.x))
            {
                x_new = golden_section(left.x, inner.x, right.x);
            }
        }
        else
        {
            x_new = golden_section(left.x, inner.x, right.x);
        }

        double dx = x_new - inner.x;
        if (std::abs(dx) < x_tolerance)
        {
            // lengthen to the tolerance, but never leave the bracket
            dx = std::copysign(x_tolerance, dx);
            if (0.0 < dx)
            {
                dx = std::min(dx, 0.9 * (right.x - inner.x));
            }
            else
            {
                dx = std::max(dx, 0.9 * (left.x - inner.x));
            }
            x_new = inner.x + dx;
        }

        const P p_new = evaluate(x_new);
        if (std::isnan(p_new.f))
        {
            return poorly_conditioned(fmt::format("f is NaN at {}", x_new), "find_brent");
        }

        // a tie moves the best point too, leaving an end point level with it (plateaus only)
        if (p_new.f <= inner.f)
        {
            previous_second_least = second_least;
            second_least          = demote(inner);
            if (x_new < inner.x)
            {
                right = demote(inner);
            }
            else
            {
                left = demote(inner);
            }
            inner = p_new;
        }
        else
        {
            if (x_new < inner.x)
            {
                left = demote(p_new);
            }
            else
            {
                right = demote(p_new);
            }
            if (p_new.f < second_least.f)
            {
                previous_second_least = second_least;
                second_least          = demote(p_new);
            }
        }
        dx3   = dx2;
        dx2   = dx;
        width = right.x - left.x;
    }
}

[[nodiscard]] auto require_tolerance(double tolerance) -> Result<void>
{
    if (!(0.0 < tolerance && tolerance < 1.0))
    {
        return make_error(ErrorKind::InvalidArgument, fmt::format("tolerance {} outside (0, 1)", tolerance),
                          {"find_brent"});
    }
    return {};
}

} // namespace

auto find_bracket(const Function1 &f, double x1, double x2, const config::MinimiserSettings &settings)
    -> Result<Bracket>
{
    if (!f)
    {
        return make_error(ErrorKind::InvalidArgument, "f is empty", {"find_bracket"});
    }
    if (!std::isfinite(x1) || !std::isfinite(x2))
    {
        return make_error(ErrorKind::InvalidArgument, fmt::format("starting points ({}, {}) not finite", x1, x2),
                          {"find_bracket"});
    }
    if (x1 == x2)
    {
        return make_error(ErrorKind::InvalidArgument, fmt::format("x1 == x2 ({})", x1), {"find_bracket"});
    }

    auto first = sample(f, x1);
    if (!first)
    {
        return with_context(first.error(), "find_bracket");
    }
    auto second = sample(f, x2);
    if (!second)
    {
        return with_context(second.error(), "find_bracket");
    }
    Function1Value p1 = *first;
    Function1Value p2 = *second;
    if (p1.f < p2.f)
    {
        std::swap(p1, p2);
    }

    auto further = step_further(f, p1, p2);
    if (!further)
    {
        return with_context(further.error(), "find_bracket");
    }
    Function1Value p3 = *further;

    // shift the window one point downhill
    const auto advance = [&](const Function1Value &p_new) {
        p1 = p2;
        p2 = p3;
        p3 = p_new;
    };

    std::uint32_t iteration = 0U;
    while (p3.f <= p2.f || p1.f <= p2.f)
    {
        if (iteration >= settings.max_bracket_iterations)
        {
            common::log_trace(settings.trace, common::kMin1LogTag, "find_bracket gave up near x={} f={}", p2.x, p2.f);
            return poorly_conditioned(fmt::format("no minimum bracketed after {} iterations (last x {}, f {})",
                                                  iteration, p3.x, p3.f),
                                      "find_bracket");
        }
        ++iteration;
        common::log_trace(settings.trace, common::kMin1LogTag, "find_bracket #{} x=({}, {}, {}) f=({}, {}, {})",
                          iteration, p1.x, p2.x, p3.x, p1.f, p2.f, p3.f);

        const double x_limit = p2.x + (kMaxStep * (p3.x - p2.x));
        const double x_new   = parabolic_extrapolation(p1, p2, p3);

        Result<Function1Value> next;
        if (is_between(p2.x, x_new, p3.x))
        {
            auto sampled = sample(f, x_new);
            if (!sampled)
            {
                return with_context(sampled.error(), "find_bracket");
            }
            if (sampled->f < p3.f)
            {
                // minimum between p2 and p3
                p1 = p2;
                p2 = *sampled;
                continue;
            }
            if (p2.f < sampled->f)
            {
                // minimum between p1 and the sample
                p3 = *sampled;
                continue;
            }
            // parabola useless, keep going downhill
            next = step_further(f, p2, p3);
        }
        else if (is_between(p3.x, x_new, x_limit))
        {
            next = sample(f, x_new);
        }
        else if (is_beyond(p3.x, x_limit, x_new))
        {
            // extrapolation too greedy, clamp it
            next = sample(f, x_limit);
        }
        else if (is_between(p1.x, x_new, p2.x))
        {
            auto sampled = sample(f, x_new);
            if (!sampled)
            {
                return with_context(sampled.error(), "find_bracket");
            }
            if (sampled->f < p1.f && sampled->f < p2.f)
            {
                p3 = p2;
                p2 = *sampled;
                continue;
            }
            next = step_further(f, p2, p3);
        }
        else
        {
            // vertex behind us (or NaN), golden step instead
            next = step_further(f, p2, p3);
        }

        if (!next)
        {
            return with_context(next.error(), "find_bracket");
        }
        advance(*next);
    }

    const auto ordered = p1.x < p3.x ? std::array<Function1Value, 3>{p1, p2, p3}
                                     : std::array<Function1Value, 3>{p3, p2, p1};
    if (!Bracket::is_valid(ordered[0], ordered[1], ordered[2]))
    {
        return poorly_conditioned(fmt::format("points ({}, {}), ({}, {}), ({}, {}) do not bracket a minimum",
                                              ordered[0].x, ordered[0].f, ordered[1].x, ordered[1].f, ordered[2].x,
                                              ordered[2].f),
                                  "find_bracket");
    }
    common::log_trace(settings.trace, common::kMin1LogTag, "find_bracket found [{}, {}, {}] after {} iterations",
                      ordered[0].x, ordered[1].x, ordered[2].x, iteration);
    return Bracket(ordered[0], ordered[1], ordered[2]);
}

auto find_brent(const Function1 &f, const Bracket &bracket, double tolerance,
                const config::MinimiserSettings &settings) -> Result<Function1Value>
{
    if (!f)
    {
        return make_error(ErrorKind::InvalidArgument, "f is empty", {"find_brent"});
    }
    if (auto ok = require_tolerance(tolerance); !ok)
    {
        return std::unexpected(ok.error());
    }
    const auto evaluate = [&f](double x) { return Function1Value{x, f(x)}; };
    return brent<Function1Value>(evaluate, bracket, bracket.inner(), tolerance, settings);
}

auto find_brent(const Function1WithGradient &f, const Bracket &bracket, double tolerance,
                const config::MinimiserSettings &settings) -> Result<Function1WithGradientValue>
{
    if (!f)
    {
        return make_error(ErrorKind::InvalidArgument, "f is empty", {"find_brent"});
    }
    if (auto ok = require_tolerance(tolerance); !ok)
    {
        return std::unexpected(ok.error());
    }
    const auto evaluate = [&f](double x) { return f(x); };
    return brent<Function1WithGradientValue>(evaluate, bracket, f(bracket.inner().x), tolerance, settings);
}

} // namespace mcm::min
