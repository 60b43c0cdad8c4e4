/**
 * @file vector_field.hpp
 * @brief vector fields R^n -> R^m and their forward-difference Jacobian
 */
#pragma once

#include <cstddef>
#include <functional>
#include <utility>

#include "mcm/common/error.hpp"
#include "mcm/config/config.hpp"
#include "mcm/linalg/matrix.hpp"
#include "mcm/linalg/vector.hpp"

namespace mcm::field
{

/**
 * @brief a function from space_dimension-D vectors to value_dimension-D vectors
 */
struct VectorField
{
    std::size_t                                           space_dimension; ///< input dimension, > 0
    std::size_t                                           value_dimension; ///< output dimension, > 0
    std::function<linalg::Vector(const linalg::Vector &)> value;           ///< f(x)
};

/**
 * @brief f(x) and the Jacobian of f at x
 *
 * invariants: j().rows() == f().dimension() and j().columns() == x().dimension()
 */
class VectorFieldWithJacobianValue
{
  public:
    /// @throws std::invalid_argument if the Jacobian shape does not match x and f
    VectorFieldWithJacobianValue(linalg::Vector x, linalg::Vector f, linalg::Matrix j);

    [[nodiscard]] auto x() const noexcept -> const linalg::Vector & { return x_; }
    [[nodiscard]] auto f() const noexcept -> const linalg::Vector & { return f_; }
    [[nodiscard]] auto j() const noexcept -> const linalg::Matrix & { return j_; }

    [[nodiscard]] friend auto operator==(const VectorFieldWithJacobianValue &lhs,
                                         const VectorFieldWithJacobianValue &rhs) noexcept -> bool
    {
        return lhs.x_ == rhs.x_ && lhs.f_ == rhs.f_ && lhs.j_ == rhs.j_;
    }

  private:
    linalg::Vector x_;
    linalg::Vector f_;
    linalg::Matrix j_;
};

/**
 * @brief forward-difference Jacobian of a field at x
 *
 * ⚠️ IMPURE FUNCTION (calls the field space_dimension + 1 times, may trace)
 *
 * the step along axis i is max(|x_i|, 1) * sqrt(epsilon), adjusted so that
 * (x_i + step) - x_i is exactly representable; column i is
 * (f(x + step e_i) - f(x)) / step.
 *
 * @param[in] field field to differentiate
 * @param[in] x point of evaluation
 * @param[in] settings only the trace switch is used
 * @return x, f(x) and the Jacobian, or InvalidArgument if a dimension is 0,
 *         x does not live in the field's space, the field is empty, or the
 *         field returns a vector of the wrong dimension
 */
[[nodiscard]] auto approximate_at(const VectorField &field, const linalg::Vector &x,
                                  const config::MinimiserSettings &settings = {})
    -> Result<VectorFieldWithJacobianValue>;

} // namespace mcm::field
