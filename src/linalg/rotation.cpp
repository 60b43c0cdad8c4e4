/**
 * @file rotation.cpp
 * @brief Rotation3 on top of the quaternion algebra
 */
#include "mcm/linalg/rotation.hpp"

#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

namespace mcm::linalg
{

auto Rotation3::from_quaternion(const Quaternion &quaternion) noexcept -> Rotation3
{
    const double norm = quaternion.norm();
    if (norm == 1.0)
    {
        return Rotation3(quaternion);
    }
    if (common::kMinNormal <= norm)
    {
        return Rotation3(quaternion.scale(1.0 / norm));
    }
    return zero();
}

auto Rotation3::from_axis_angle(const Vector3 &axis, double angle) -> Rotation3
{
    const double half      = angle * 0.5;
    const double c         = std::cos(half);
    const double s         = std::sin(half);
    const double magnitude = axis.magnitude();

    const bool small_angle = std::abs(s) < common::kMinNormal && (1.0 - c) < common::kMinNormal;
    if (small_angle)
    {
        return zero();
    }
    if (!(common::kMinNormal <= magnitude))
    {
        throw std::invalid_argument(
            fmt::format("zero rotation axis ({}, {}, {}) for angle {}", axis[0], axis[1], axis[2], angle));
    }
    const double f = s / magnitude;
    return Rotation3(Quaternion(c, f * axis[0], f * axis[1], f * axis[2]));
}

auto Rotation3::apply(const Vector3 &v) const noexcept -> Vector3
{
    const Quaternion rotated = versor_.conjugation(Quaternion(0.0, v[0], v[1], v[2]));
    return Vector3{rotated.b(), rotated.c(), rotated.d()};
}

auto Rotation3::angle() const noexcept -> double
{
    return std::atan2(versor_.vector().norm(), versor_.a()) * 2.0;
}

auto Rotation3::axis() const noexcept -> Vector3
{
    const Vector3 su{versor_.b(), versor_.c(), versor_.d()};
    const double  magnitude = su.magnitude();
    if (common::kMinNormal < magnitude)
    {
        return su.scale(1.0 / magnitude);
    }
    return Vector3::zero();
}

auto Rotation3::plus(const Rotation3 &that) const noexcept -> Rotation3
{
    return Rotation3(versor_.product(that.versor_));
}

auto Rotation3::minus() const noexcept -> Rotation3
{
    return Rotation3(versor_.conjugate());
}

auto Rotation3::minus(const Rotation3 &that) const noexcept -> Rotation3
{
    return Rotation3(that.versor_.conjugate().product(versor_));
}

auto Rotation3::scale(double f) const noexcept -> Rotation3
{
    return Rotation3(versor_.pow(f));
}

} // namespace mcm::linalg
