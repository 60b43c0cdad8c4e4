/**
 * @file function.hpp
 * @brief function handles + sampled function values the minimisers pass around
 *
 * objective functions are plain std::function handles so callers can hand in
 * lambdas, functors or free functions. the N-D handles carry their domain
 * dimension next to the callable because the minimisers validate it before
 * evaluating anything.
 *
 * the *Value structs are what a minimiser hands back: the abscissa it found
 * plus whatever it learned there. they compare by bit pattern like every other
 * mcm value type.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <utility>

#include "mcm/common/math.hpp"
#include "mcm/linalg/vector.hpp"

namespace mcm::min
{

/**
 * @brief f(x) sampled at one point
 *
 * ✨ PURE FUNCTION ✨ (plain aggregate)
 */
struct Function1Value
{
    double x; ///< abscissa
    double f; ///< f(x)

    [[nodiscard]] friend constexpr auto operator==(const Function1Value &lhs, const Function1Value &rhs) noexcept
        -> bool
    {
        return common::bit_equal(lhs.x, rhs.x) && common::bit_equal(lhs.f, rhs.f);
    }
};

/**
 * @brief f(x) and f'(x) sampled at one point
 */
struct Function1WithGradientValue
{
    double x;    ///< abscissa
    double f;    ///< f(x)
    double dfdx; ///< derivative at x

    [[nodiscard]] friend constexpr auto operator==(const Function1WithGradientValue &lhs,
                                                   const Function1WithGradientValue &rhs) noexcept -> bool
    {
        return common::bit_equal(lhs.x, rhs.x) && common::bit_equal(lhs.f, rhs.f) &&
               common::bit_equal(lhs.dfdx, rhs.dfdx);
    }
};

/**
 * @brief f(x) and the gradient of f at an N-D point
 *
 * invariant: x().dimension() == dfdx().dimension()
 */
class FunctionNWithGradientValue
{
  public:
    /// @throws std::invalid_argument if x and dfdx differ in dimension
    FunctionNWithGradientValue(linalg::Vector x, double f, linalg::Vector dfdx)
        : x_(std::move(x)), f_(f), dfdx_(std::move(dfdx))
    {
        linalg::detail::require_same_dimension(x_.dimension(), dfdx_.dimension(), "FunctionNWithGradientValue");
    }

    [[nodiscard]] auto x() const noexcept -> const linalg::Vector & { return x_; }
    [[nodiscard]] auto f() const noexcept -> double { return f_; }
    [[nodiscard]] auto dfdx() const noexcept -> const linalg::Vector & { return dfdx_; }

    [[nodiscard]] friend auto operator==(const FunctionNWithGradientValue &lhs,
                                         const FunctionNWithGradientValue &rhs) noexcept -> bool
    {
        return lhs.x_ == rhs.x_ && common::bit_equal(lhs.f_, rhs.f_) && lhs.dfdx_ == rhs.dfdx_;
    }

  private:
    linalg::Vector x_;
    double         f_;
    linalg::Vector dfdx_;
};

/// scalar function of one variable
using Function1 = std::function<double(double)>;

/// scalar function of one variable that also reports its derivative
using Function1WithGradient = std::function<Function1WithGradientValue(double)>;

/**
 * @brief scalar function of an N-D vector
 */
struct FunctionN
{
    std::size_t                                   dimension; ///< domain dimension, > 0
    std::function<double(const linalg::Vector &)> value;     ///< f(x); x.dimension() == dimension
};

/**
 * @brief scalar function of an N-D vector that also reports its gradient
 */
struct FunctionNWithGradient
{
    std::size_t                                                       dimension; ///< domain dimension, > 0
    std::function<FunctionNWithGradientValue(const linalg::Vector &)> value;     ///< f and grad f at x
};

} // namespace mcm::min
