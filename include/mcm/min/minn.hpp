/**
 * @file minn.hpp
 * @brief N-D minimisation: line functions, line search, Powell, FRPR conjugate gradient uwu
 *
 * everything here reduces to 1-D work: a line function restricts f to
 * x0 + w dx, minimise_along_line() brackets and Brent-minimises it from
 * w in {0, 1}, and the two N-D drivers pick which lines to search.
 *
 * in-place convention: every routine that updates the caller's point takes
 * it as a MutableVector reference (and says so). find_fletcher_reeves_polak_ribere
 * takes its starting point by const reference and returns a new value.
 *
 * @author LukeFrankio
 * @date 2025-11-05
 * @version 1.1
 *
 * example (basic usage):
 * @code
 * using namespace mcm;
 * const min::FunctionN paraboloid{2U, [](const linalg::Vector &x) { return x.magnitude2(); }};
 * linalg::MutableVector x{1.0, 1.0};
 * auto value = min::find_powell(paraboloid, x, 1e-5);
 * // x ~ (0, 0), *value ~ 0
 * @endcode
 */
#pragma once

#include "mcm/common/error.hpp"
#include "mcm/config/config.hpp"
#include "mcm/linalg/vector.hpp"
#include "mcm/min/function.hpp"

namespace mcm::min
{

/**
 * @brief the 1-D restriction w -> f(x0 + w dx)
 *
 * ✨ PURE FUNCTION ✨ (the returned handle copies x0 and dx)
 *
 * @throws std::invalid_argument if f, x0 and dx disagree on dimension
 */
[[nodiscard]] auto create_line_function(const FunctionN &f, const linalg::Vector &x0, const linalg::Vector &dx)
    -> Function1;

/**
 * @brief gradient-aware restriction; the derivative is dot(grad f(x0 + w dx), dx)
 *
 * @throws std::invalid_argument if f, x0 and dx disagree on dimension
 */
[[nodiscard]] auto create_line_function(const FunctionNWithGradient &f, const linalg::Vector &x0,
                                        const linalg::Vector &dx) -> Function1WithGradient;

/**
 * @brief minimise f along the line through x in direction dx
 *
 * ⚠️ IMPURE FUNCTION (mutates x and dx)
 *
 * on success x moves to the line minimum x + w dx and dx becomes the
 * displacement actually taken (w dx, so zero when x was already optimal).
 * on failure both are left untouched.
 *
 * @param[in] f function to minimise
 * @param[in,out] x start point, then the line minimum
 * @param[in,out] dx search direction, then the displacement
 * @param[in] settings effort caps, Brent tolerance and trace switch
 * @return f at the new x, or
 *         - InvalidArgument on dimension mismatch
 *         - PoorlyConditioned if dx is zero or the line cannot be minimised
 */
[[nodiscard]] auto minimise_along_line(const FunctionN &f, linalg::MutableVector &x, linalg::MutableVector &dx,
                                       const config::MinimiserSettings &settings = {}) -> Result<double>;

/**
 * @brief gradient-aware line minimisation; same contract, returns f and grad f at the new x
 */
[[nodiscard]] auto minimise_along_line(const FunctionNWithGradient &f, linalg::MutableVector &x,
                                       linalg::MutableVector &dx, const config::MinimiserSettings &settings = {})
    -> Result<FunctionNWithGradientValue>;

/**
 * @brief Powell's derivative-free direction-set method
 *
 * ⚠️ IMPURE FUNCTION (mutates x)
 *
 * directions start at the coordinate axes and are reset to them every N
 * iterations and whenever an iteration barely moves x. each iteration
 * line-minimises along every direction, then swaps the direction that gave
 * the largest single decrease for the net displacement of the iteration and
 * searches along that too. stops when
 * 2 (f_prev - f) <= tolerance (|f_prev| + |f|) + 1e-25.
 *
 * @param[in] f function to minimise
 * @param[in,out] x starting point, then the minimum found
 * @param[in] tolerance fractional decrease tolerance in (0, 1)
 * @param[in] settings effort caps (max_powell_iterations) and trace switch
 * @return the minimum value, or
 *         - InvalidArgument on dimension mismatch or tolerance outside (0, 1)
 *         - PoorlyConditioned if a line search fails or the cap is exceeded
 */
[[nodiscard]] auto find_powell(const FunctionN &f, linalg::MutableVector &x, double tolerance,
                               const config::MinimiserSettings &settings = {}) -> Result<double>;

/**
 * @brief Fletcher-Reeves-Polak-Ribiere nonlinear conjugate gradient
 *
 * ✨ x0 is never mutated ✨
 *
 * starts down the steepest slope, then mixes each new steepest-descent
 * direction with the previous search direction using the Polak-Ribiere
 * beta = max(0, dot(g_new - g, g_new) / |g|^2) (a negative beta restarts
 * with steepest descent). converged when the gradient underflows, or when an
 * iteration decreases f by at most tolerance^2 / 2 times the largest decrease
 * seen so far. a line search that fails after progress has been made is
 * taken as convergence at the current point.
 *
 * @param[in] f function (with gradient) to minimise
 * @param[in] x0 starting point
 * @param[in] tolerance fractional tolerance in (0, 1)
 * @param[in] settings effort caps (max_conjugate_gradient_iterations) and trace switch
 * @return x, f and grad f at the minimum found, or
 *         - InvalidArgument on dimension mismatch or tolerance outside (0, 1)
 *         - PoorlyConditioned if the first line search fails or the cap is exceeded
 */
[[nodiscard]] auto find_fletcher_reeves_polak_ribere(const FunctionNWithGradient &f, const linalg::Vector &x0,
                                                     double tolerance, const config::MinimiserSettings &settings = {})
    -> Result<FunctionNWithGradientValue>;

} // namespace mcm::min
