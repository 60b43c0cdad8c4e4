/**
 * @file orientation.cpp
 * @brief basis validation for OrientationVectors3
 */
#include "mcm/linalg/orientation.hpp"

#include <cmath>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace mcm::linalg
{
namespace
{

void require_unit_3_vector(const Vector &e, std::string_view name)
{
    if (e.dimension() != 3U)
    {
        throw std::invalid_argument(fmt::format("{} has dimension {}, expected 3", name, e.dimension()));
    }
    const double m2 = e.magnitude2();
    if (!(std::abs(m2 - 1.0) <= common::kUlpOne))
    {
        throw std::invalid_argument(fmt::format("{} is not a unit vector (magnitude^2 {})", name, m2));
    }
}

void require_orthogonal(const Vector &lhs, std::string_view lhs_name, const Vector &rhs, std::string_view rhs_name)
{
    const double d = lhs.dot(rhs);
    if (d != 0.0)
    {
        throw std::invalid_argument(fmt::format("{} and {} are not orthogonal (dot {})", lhs_name, rhs_name, d));
    }
}

} // namespace

OrientationVectors3::OrientationVectors3(Vector e1, Vector e2, Vector e3)
    : e1_(std::move(e1)), e2_(std::move(e2)), e3_(std::move(e3))
{
}

auto OrientationVectors3::create_from_orthogonal_unit_basis_vectors(const Vector &e1, const Vector &e2,
                                                                    const Vector &e3) -> OrientationVectors3
{
    require_unit_3_vector(e1, "e1");
    require_unit_3_vector(e2, "e2");
    require_unit_3_vector(e3, "e3");
    require_orthogonal(e1, "e1", e2, "e2");
    require_orthogonal(e1, "e1", e3, "e3");
    require_orthogonal(e2, "e2", e3, "e3");
    return OrientationVectors3(e1, e2, e3);
}

auto OrientationVectors3::global_basis() -> OrientationVectors3
{
    return OrientationVectors3(Vector{1.0, 0.0, 0.0}, Vector{0.0, 1.0, 0.0}, Vector{0.0, 0.0, 1.0});
}

} // namespace mcm::linalg
