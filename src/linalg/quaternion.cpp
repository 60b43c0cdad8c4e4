/**
 * @file quaternion.cpp
 * @brief transcendental quaternion functions (exp, log, pow) + friends
 */
#include "mcm/linalg/quaternion.hpp"

#include <cmath>

namespace mcm::linalg
{
namespace
{

/// below this |v| the series form of sin(|v|)/|v| is exact to double precision
const double kExpSeriesThreshold = std::pow(common::kMinNormal, 1.0 / 6.0) * 840.0;

} // namespace

auto Quaternion::reciprocal() const noexcept -> Quaternion
{
    return conjugate().scale(1.0 / norm2());
}

auto Quaternion::versor() const noexcept -> Quaternion
{
    const double n = norm();
    if (common::kMinNormal < n)
    {
        return scale(1.0 / n);
    }
    return zero();
}

auto Quaternion::exp() const noexcept -> Quaternion
{
    const double     ea = std::exp(a_);
    const Quaternion v  = vector();
    const double     vn = v.norm();

    double sin_term = 0.0;
    if (kExpSeriesThreshold < std::abs(vn))
    {
        sin_term = std::sin(vn) / vn;
    }
    else
    {
        const double x2 = vn * vn;
        sin_term        = 1.0 - (x2 * (1.0 / 6.0) * (1.0 - (x2 * 0.05)));
    }
    return Quaternion(ea * std::cos(vn), 0.0, 0.0, 0.0).plus(v.scale(ea * sin_term));
}

auto Quaternion::log() const noexcept -> Quaternion
{
    const double n = norm();
    return Quaternion(std::log(n), 0.0, 0.0, 0.0).plus(vector().versor().scale(std::acos(a_ / n)));
}

auto Quaternion::pow(double p) const noexcept -> Quaternion
{
    const double     n         = norm();
    const Quaternion v         = vector();
    const Quaternion direction = v.versor();
    // real part of conj(n) * v is |v| measured along n
    const double y     = direction.conjugate().product(v).a();
    const double theta = std::atan2(y, a_);
    return direction.scale(theta * p).exp().scale(std::pow(n, p));
}

auto Quaternion::conjugation(const Quaternion &p) const noexcept -> Quaternion
{
    return product(p).product(conjugate()).scale(1.0 / norm2());
}

} // namespace mcm::linalg
