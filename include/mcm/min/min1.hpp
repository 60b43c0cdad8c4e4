/**
 * @file min1.hpp
 * @brief 1-D minimisation: bracket search + Brent's method uwu
 *
 * the usual two-phase recipe. find_bracket() walks downhill from two starting
 * abscissas, growing the step by the golden ratio (with clamped parabolic
 * extrapolation when the parabola looks trustworthy) until three points
 * enclose a minimum. find_brent() then narrows that bracket with
 * inverse-parabolic steps, falling back to golden-section steps whenever the
 * parabola misbehaves.
 *
 * neither function throws for "this function cannot be minimised". they
 * return mcm::Result, and the error kind says whether the call was malformed
 * (InvalidArgument) or the function defeated the heuristics within the
 * configured effort (PoorlyConditioned). there are no internal retries.
 *
 * @author LukeFrankio
 * @date 2025-11-05
 * @version 1.1
 *
 * example (basic usage):
 * @code
 * using namespace mcm::min;
 * const Function1 f = [](double x) { return x * x; };
 * auto bracket = find_bracket(f, -1.0, 1.0);
 * if (!bracket) { return; }
 * auto best = find_brent(f, *bracket, 1e-3);
 * // best->x ~ 0, best->f <= bracket->min()
 * @endcode
 */
#pragma once

#include <cmath>

#include "mcm/common/error.hpp"
#include "mcm/common/math.hpp"
#include "mcm/config/config.hpp"
#include "mcm/min/bracket.hpp"
#include "mcm/min/function.hpp"

namespace mcm::min
{

/// recommended fractional tolerance for find_brent, sqrt of the ULP of 1.0
inline const double kTolerance = std::sqrt(common::kUlpOne);

/**
 * @brief find three points that bracket a minimum of f
 *
 * ⚠️ IMPURE FUNCTION (calls f, may trace to stdout)
 *
 * orders the starting points so the second one is downhill, then expands in
 * that direction. ties in f count as non-bracketing and keep the search
 * expanding. NaN values of f are retried with a halved step before giving up.
 *
 * @param[in] f function to bracket
 * @param[in] x1 first starting abscissa
 * @param[in] x2 second starting abscissa, != x1
 * @param[in] settings effort cap (max_bracket_iterations) and trace switch
 * @return a valid Bracket, or
 *         - InvalidArgument if f is empty, x1 == x2 or either is not finite
 *         - PoorlyConditioned if the cap is exceeded, an abscissa overflows,
 *           f stays NaN, or stepping stalls in floating point
 */
[[nodiscard]] auto find_bracket(const Function1 &f, double x1, double x2,
                                const config::MinimiserSettings &settings = {}) -> Result<Bracket>;

/**
 * @brief narrow a bracket to a minimum with Brent's method
 *
 * ⚠️ IMPURE FUNCTION (calls f, may trace to stdout)
 *
 * converges when the bracket width is at most twice the x tolerance,
 * max(|x| * tolerance, a tiny absolute floor). the floor keeps minima at
 * x == 0 from demanding a subnormal-width bracket.
 *
 * @param[in] f function to minimise
 * @param[in] bracket bracket of a minimum of f
 * @param[in] tolerance fractional tolerance in (0, 1); kTolerance is a good default
 * @param[in] settings effort cap (max_brent_iterations) and trace switch
 * @return the best point found, with f <= bracket.min(), or
 *         - InvalidArgument if f is empty or tolerance is outside (0, 1)
 *         - PoorlyConditioned if f returns NaN or the cap is exceeded
 */
[[nodiscard]] auto find_brent(const Function1 &f, const Bracket &bracket, double tolerance,
                              const config::MinimiserSettings &settings = {}) -> Result<Function1Value>;

/**
 * @brief Brent's method for a function that also reports its derivative
 *
 * same steps and termination test as the value-only overload; the derivative
 * is carried through to the result rather than used to choose steps.
 */
[[nodiscard]] auto find_brent(const Function1WithGradient &f, const Bracket &bracket, double tolerance,
                              const config::MinimiserSettings &settings = {})
    -> Result<Function1WithGradientValue>;

} // namespace mcm::min
