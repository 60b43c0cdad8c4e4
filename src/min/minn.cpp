/**
 * @file minn.cpp
 * @brief line search, Powell's method and FRPR conjugate gradient
 *
 * the conjugate-gradient loop is the usual residual / beta / direction update
 * with a convergence check against a scaled tolerance, except that the step
 * length along each direction comes from a 1-D minimisation instead of a
 * closed form.
 */
#include "mcm/min/minn.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "mcm/common/log.hpp"
#include "mcm/min/min1.hpp"

namespace mcm::min
{
namespace
{

/// absolute slack in Powell's convergence test so f == 0 can converge
constexpr double kPowellTiny = 1.0e-25;

void require_line_dimensions(std::size_t f_dimension, std::size_t x_dimension, std::size_t dx_dimension)
{
    if (f_dimension != x_dimension || x_dimension != dx_dimension)
    {
        throw std::invalid_argument(fmt::format("inconsistent dimensions: f {}, x0 {}, dx {}", f_dimension,
                                                x_dimension, dx_dimension));
    }
}

[[nodiscard]] auto invalid(std::string message, const char *operation) -> std::unexpected<Error>
{
    return make_error(ErrorKind::InvalidArgument, std::move(message), {operation});
}

/// breadcrumb "operation > iteration N > ..." for an error from inside a loop
[[nodiscard]] auto nest(Error error, const char *operation, std::uint32_t iteration) -> std::unexpected<Error>
{
    error.context.insert(error.context.begin(), fmt::format("iteration {}", iteration));
    return with_context(std::move(error), operation);
}

[[nodiscard]] auto check_tolerance(double tolerance, const char *operation) -> Result<void>
{
    if (!(0.0 < tolerance && tolerance < 1.0))
    {
        return invalid(fmt::format("tolerance {} outside (0, 1)", tolerance), operation);
    }
    return {};
}

void reset_search_directions(std::vector<linalg::MutableVector> &directions)
{
    const std::size_t n = directions.size();
    for (std::size_t i = 0; i < n; ++i)
    {
        for (std::size_t j = 0; j < n; ++j)
        {
            directions[i][j] = i == j ? 1.0 : 0.0;
        }
    }
}

/// shared argument checks of the two minimise_along_line overloads
template <typename F>
[[nodiscard]] auto check_line_arguments(const F &f, const linalg::MutableVector &x, const linalg::MutableVector &dx)
    -> Result<void>
{
    if (!f.value)
    {
        return invalid("f is empty", "minimise_along_line");
    }
    if (f.dimension != x.dimension() || x.dimension() != dx.dimension())
    {
        return invalid(fmt::format("inconsistent dimensions: f {}, x {}, dx {}", f.dimension, x.dimension(),
                                   dx.dimension()),
                       "minimise_along_line");
    }
    if (!(0.0 < dx.magnitude2()))
    {
        return make_error(ErrorKind::PoorlyConditioned, "search direction has zero magnitude",
                          {"minimise_along_line"});
    }
    return {};
}

} // namespace

auto create_line_function(const FunctionN &f, const linalg::Vector &x0, const linalg::Vector &dx) -> Function1
{
    require_line_dimensions(f.dimension, x0.dimension(), dx.dimension());
    if (!f.value)
    {
        throw std::invalid_argument("create_line_function: f is empty");
    }
    return [value = f.value, x0, dx](double w) { return value(linalg::Vector::on_line(x0, dx, w)); };
}

auto create_line_function(const FunctionNWithGradient &f, const linalg::Vector &x0, const linalg::Vector &dx)
    -> Function1WithGradient
{
    require_line_dimensions(f.dimension, x0.dimension(), dx.dimension());
    if (!f.value)
    {
        throw std::invalid_argument("create_line_function: f is empty");
    }
    return [value = f.value, x0, dx](double w) {
        const FunctionNWithGradientValue v = value(linalg::Vector::on_line(x0, dx, w));
        return Function1WithGradientValue{w, v.f(), v.dfdx().dot(dx)};
    };
}

auto minimise_along_line(const FunctionN &f, linalg::MutableVector &x, linalg::MutableVector &dx,
                         const config::MinimiserSettings &settings) -> Result<double>
{
    if (auto ok = check_line_arguments(f, x, dx); !ok)
    {
        return std::unexpected(ok.error());
    }

    const Function1 line    = create_line_function(f, x.freeze(), dx.freeze());
    auto            bracket = find_bracket(line, 0.0, 1.0, settings);
    if (!bracket)
    {
        return with_context(bracket.error(), "minimise_along_line");
    }
    auto best = find_brent(line, *bracket, settings.tolerance, settings);
    if (!best)
    {
        return with_context(best.error(), "minimise_along_line");
    }

    dx.scale_in_place(best->x);
    x.add_scaled(1.0, dx);
    return best->f;
}

auto minimise_along_line(const FunctionNWithGradient &f, linalg::MutableVector &x, linalg::MutableVector &dx,
                         const config::MinimiserSettings &settings) -> Result<FunctionNWithGradientValue>
{
    if (auto ok = check_line_arguments(f, x, dx); !ok)
    {
        return std::unexpected(ok.error());
    }

    const Function1WithGradient line        = create_line_function(f, x.freeze(), dx.freeze());
    const Function1             line_values = [&line](double w) { return line(w).f; };
    auto                        bracket     = find_bracket(line_values, 0.0, 1.0, settings);
    if (!bracket)
    {
        return with_context(bracket.error(), "minimise_along_line");
    }
    auto best = find_brent(line, *bracket, settings.tolerance, settings);
    if (!best)
    {
        return with_context(best.error(), "minimise_along_line");
    }

    dx.scale_in_place(best->x);
    x.add_scaled(1.0, dx);
    return f.value(x.freeze());
}

auto find_powell(const FunctionN &f, linalg::MutableVector &x, double tolerance,
                 const config::MinimiserSettings &settings) -> Result<double>
{
    if (!f.value)
    {
        return invalid("f is empty", "find_powell");
    }
    if (f.dimension != x.dimension())
    {
        return invalid(fmt::format("inconsistent dimensions: f {}, x {}", f.dimension, x.dimension()), "find_powell");
    }
    if (auto ok = check_tolerance(tolerance, "find_powell"); !ok)
    {
        return std::unexpected(ok.error());
    }

    const std::size_t                  n = x.dimension();
    std::vector<linalg::MutableVector> directions(n, linalg::MutableVector(n));
    linalg::MutableVector              x_start(n);
    linalg::MutableVector              dx(n);

    double f_min = f.value(x.freeze());
    if (std::isnan(f_min))
    {
        return make_error(ErrorKind::PoorlyConditioned, "f is NaN at the starting point", {"find_powell"});
    }

    for (std::uint32_t iteration = 0;; ++iteration)
    {
        if (iteration >= settings.max_powell_iterations)
        {
            common::log_trace(settings.trace, common::kMinNLogTag, "find_powell gave up at f={}", f_min);
            return make_error(ErrorKind::PoorlyConditioned,
                              fmt::format("not converged after {} iterations (f {})", iteration, f_min),
                              {"find_powell"});
        }
        if (iteration % n == 0U)
        {
            reset_search_directions(directions);
        }

        x_start.assign(x);
        const double f_start          = f_min;
        std::size_t  biggest          = 0U;
        double       biggest_decrease = 0.0;
        for (std::size_t i = 0; i < n; ++i)
        {
            dx.assign(directions[i]);
            const double f_before = f_min;
            auto         line     = minimise_along_line(f, x, dx, settings);
            if (!line)
            {
                return nest(line.error(), "find_powell", iteration);
            }
            f_min = *line;
            if (biggest_decrease < f_before - f_min)
            {
                biggest_decrease = f_before - f_min;
                biggest          = i;
            }
        }
        common::log_trace(settings.trace, common::kMinNLogTag, "find_powell #{} f={} (was {})", iteration, f_min,
                          f_start);

        if (2.0 * (f_start - f_min) <= (tolerance * (std::abs(f_start) + std::abs(f_min))) + kPowellTiny)
        {
            common::log_trace(settings.trace, common::kMinNLogTag, "find_powell converged after {} iterations",
                              iteration + 1U);
            return f_min;
        }

        // conjugate-direction heuristic: the net displacement replaces the best direction
        linalg::MutableVector net = x.minus(x_start);
        if (common::max_abs(net.components()) < kTolerance)
        {
            reset_search_directions(directions);
            continue;
        }
        directions[biggest].assign(directions[n - 1U]);
        directions[n - 1U].assign(net);
        dx.assign(net);
        auto line = minimise_along_line(f, x, dx, settings);
        if (!line)
        {
            return nest(line.error(), "find_powell", iteration);
        }
        f_min = *line;
    }
}

auto find_fletcher_reeves_polak_ribere(const FunctionNWithGradient &f, const linalg::Vector &x0, double tolerance,
                                       const config::MinimiserSettings &settings) -> Result<FunctionNWithGradientValue>
{
    constexpr const char *kOperation = "find_fletcher_reeves_polak_ribere";
    if (!f.value)
    {
        return invalid("f is empty", kOperation);
    }
    if (f.dimension != x0.dimension())
    {
        return invalid(fmt::format("inconsistent dimensions: f {}, x0 {}", f.dimension, x0.dimension()), kOperation);
    }
    if (auto ok = check_tolerance(tolerance, kOperation); !ok)
    {
        return std::unexpected(ok.error());
    }

    FunctionNWithGradientValue fx = f.value(x0);
    if (std::isnan(fx.f()))
    {
        return make_error(ErrorKind::PoorlyConditioned, "f is NaN at the starting point", {kOperation});
    }
    if (fx.dfdx().magnitude2() < common::kMinNormal)
    {
        return fx;
    }

    const std::size_t     n = x0.dimension();
    linalg::MutableVector g(fx.dfdx().minus()); // steepest descent
    linalg::MutableVector h(g);                 // search direction
    linalg::MutableVector x(n);
    linalg::MutableVector dx(n);
    double                f_scale = 0.0;

    for (std::uint32_t iteration = 0;; ++iteration)
    {
        if (iteration >= settings.max_conjugate_gradient_iterations)
        {
            common::log_trace(settings.trace, common::kMinNLogTag, "{} gave up at f={}", kOperation, fx.f());
            return make_error(ErrorKind::PoorlyConditioned,
                              fmt::format("not converged after {} iterations (f {})", iteration, fx.f()),
                              {kOperation});
        }

        x.assign(fx.x());
        dx.assign(h);
        auto next = minimise_along_line(f, x, dx, settings);
        if (!next)
        {
            if (0U < iteration && is_poorly_conditioned(next.error()))
            {
                // no further progress possible along h: fx is as good as it gets
                common::log_trace(settings.trace, common::kMinNLogTag, "{} stopped at f={}: {}", kOperation, fx.f(),
                                  describe(next.error()));
                return fx;
            }
            return nest(next.error(), kOperation, iteration);
        }

        const double df = fx.f() - next->f();
        f_scale         = std::max(f_scale, df);
        fx              = std::move(*next);
        common::log_trace(settings.trace, common::kMinNLogTag, "{} #{} f={} df={}", kOperation, iteration, fx.f(), df);

        if (df <= f_scale * tolerance * tolerance * 0.5)
        {
            return fx;
        }
        if (fx.dfdx().magnitude2() < common::kMinNormal)
        {
            return fx;
        }

        const linalg::MutableVector g_new(fx.dfdx().minus());
        const double                beta = std::max(0.0, g_new.minus(g).dot(g_new) / g.magnitude2());
        h.scale_in_place(beta);
        h.add_scaled(1.0, g_new);
        g.assign(g_new);
    }
}

} // namespace mcm::min
