/**
 * @file vector_field.cpp
 * @brief forward-difference Jacobian approximation
 */
#include "mcm/field/vector_field.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "mcm/common/log.hpp"
#include "mcm/common/math.hpp"

namespace mcm::field
{
namespace
{

[[nodiscard]] auto invalid(std::string message) -> std::unexpected<Error>
{
    return make_error(ErrorKind::InvalidArgument, std::move(message), {"approximate_at"});
}

/// evaluate the field, rejecting results of the wrong dimension
[[nodiscard]] auto evaluate(const VectorField &field, const linalg::Vector &x) -> Result<linalg::Vector>
{
    linalg::Vector value = field.value(x);
    if (value.dimension() != field.value_dimension)
    {
        return invalid(fmt::format("field returned dimension {}, expected {}", value.dimension(),
                                   field.value_dimension));
    }
    return value;
}

} // namespace

VectorFieldWithJacobianValue::VectorFieldWithJacobianValue(linalg::Vector x, linalg::Vector f, linalg::Matrix j)
    : x_(std::move(x)), f_(std::move(f)), j_(std::move(j))
{
    if (j_.columns() != x_.dimension() || j_.rows() != f_.dimension())
    {
        throw std::invalid_argument(fmt::format("Jacobian shape {}x{} inconsistent with x dimension {} and f dimension {}",
                                                j_.rows(), j_.columns(), x_.dimension(), f_.dimension()));
    }
}

auto approximate_at(const VectorField &field, const linalg::Vector &x, const config::MinimiserSettings &settings)
    -> Result<VectorFieldWithJacobianValue>
{
    if (field.space_dimension == 0U || field.value_dimension == 0U)
    {
        return invalid(fmt::format("field dimensions {} -> {} must be > 0", field.space_dimension,
                                   field.value_dimension));
    }
    if (!field.value)
    {
        return invalid("field is empty");
    }
    if (x.dimension() != field.space_dimension)
    {
        return invalid(fmt::format("x has dimension {}, field expects {}", x.dimension(), field.space_dimension));
    }

    auto f0 = evaluate(field, x);
    if (!f0)
    {
        return std::unexpected(f0.error());
    }

    const double          scale = std::sqrt(common::kUlpOne);
    const std::size_t     n     = field.space_dimension;
    const std::size_t     m     = field.value_dimension;
    linalg::MutableVector x_step(x);
    linalg::MutableMatrix j(m, n);

    for (std::size_t i = 0; i < n; ++i)
    {
        const double xi = x[i];
        // round the step so x + delta - x is exact
        const double temp  = xi + (std::max(std::abs(xi), 1.0) * scale);
        const double delta = temp - xi;
        x_step[i]          = temp;

        auto fi = evaluate(field, x_step.freeze());
        if (!fi)
        {
            return std::unexpected(fi.error());
        }
        for (std::size_t k = 0; k < m; ++k)
        {
            j.set(k, i, ((*fi)[k] - (*f0)[k]) / delta);
        }
        x_step[i] = xi;
        common::log_trace(settings.trace, common::kFieldLogTag, "approximate_at column {} step {}", i, delta);
    }

    return VectorFieldWithJacobianValue(x, std::move(*f0), j.freeze());
}

} // namespace mcm::field
