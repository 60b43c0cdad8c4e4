/**
 * @file rotation.hpp
 * @brief 3-D rotations backed by a unit quaternion (versor)
 *
 * handedness is the right-hand rule: a positive angle about axis u turns
 * counter-clockwise when viewed from the tip of u, so a quarter turn about
 * (1, 0, 0) takes (0, 1, 0) to (0, 0, 1).
 *
 * composition reads like function composition: a.plus(b) applies b first,
 * then a. minus(that) is the rotation r with that.plus(r) == this.
 *
 * @author LukeFrankio
 * @date 2025-11-05
 * @version 1.1
 *
 * example:
 * @code
 * using namespace mcm::linalg;
 * const auto quarter = Rotation3::from_axis_angle(Vector3::i(), std::numbers::pi / 2.0);
 * const auto up      = quarter.apply(Vector3::j()); // ~(0, 0, 1)
 * @endcode
 */
#pragma once

#include "mcm/linalg/quaternion.hpp"
#include "mcm/linalg/vector.hpp"

namespace mcm::linalg
{

/**
 * @brief immutable rotation
 *
 * invariant: versor() has unit norm (to rounding), or is exactly one() for
 * the identity.
 */
class Rotation3
{
  public:
    /// the identity rotation
    [[nodiscard]] static constexpr auto zero() noexcept -> Rotation3 { return Rotation3(Quaternion::one()); }

    /**
     * @brief rotation represented by q / |q|
     *
     * ✨ PURE FUNCTION ✨
     *
     * @return zero() when |q| is below the smallest normal double
     */
    [[nodiscard]] static auto from_quaternion(const Quaternion &quaternion) noexcept -> Rotation3;

    /**
     * @brief rotation of `angle` radians about `axis` (any non-zero length)
     *
     * @throws std::invalid_argument if the axis is zero and the angle is not
     *         effectively a multiple of 4 pi
     */
    [[nodiscard]] static auto from_axis_angle(const Vector3 &axis, double angle) -> Rotation3;

    [[nodiscard]] auto apply(const Vector3 &v) const noexcept -> Vector3;

    /// rotation angle in [-2 pi, 2 pi]
    [[nodiscard]] auto angle() const noexcept -> double;

    /// unit rotation axis, or the zero vector for the identity
    [[nodiscard]] auto axis() const noexcept -> Vector3;

    [[nodiscard]] constexpr auto versor() const noexcept -> const Quaternion & { return versor_; }

    /// apply that, then this
    [[nodiscard]] auto plus(const Rotation3 &that) const noexcept -> Rotation3;

    /// inverse rotation
    [[nodiscard]] auto minus() const noexcept -> Rotation3;

    /// relative rotation r such that that.plus(r) == *this
    [[nodiscard]] auto minus(const Rotation3 &that) const noexcept -> Rotation3;

    /// same axis, angle multiplied by f
    [[nodiscard]] auto scale(double f) const noexcept -> Rotation3;

    [[nodiscard]] friend constexpr auto operator==(const Rotation3 &lhs, const Rotation3 &rhs) noexcept -> bool
    {
        return lhs.versor_ == rhs.versor_;
    }

  private:
    constexpr explicit Rotation3(const Quaternion &versor) noexcept : versor_(versor) {}

    Quaternion versor_;
};

} // namespace mcm::linalg
