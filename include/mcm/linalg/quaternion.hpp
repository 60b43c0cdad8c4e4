/**
 * @file quaternion.hpp
 * @brief immutable quaternions a + bi + cj + dk (Hamilton convention) uwu
 *
 * the rotation layer stores its state as a unit quaternion, so this type
 * carries the whole algebra Rotation3 needs: Hamilton product, conjugate,
 * versor, exp/log and real powers. norms use the same largest-component
 * scaling as the vector types, so quaternions with components near 1e200
 * still have a finite norm.
 *
 * exp and log are mutual inverses for finite non-degenerate quaternions
 * (within a tolerance proportional to the norm). for |v| below a tiny
 * threshold exp() switches to the series 1 - x^2/6 (1 - x^2/20) for
 * sin(|v|)/|v| so pure scalars do not divide by zero.
 *
 * @author LukeFrankio
 * @date 2025-11-05
 * @version 1.1
 *
 * example:
 * @code
 * using mcm::linalg::Quaternion;
 * const auto ij = Quaternion::i().product(Quaternion::j()); // == k()
 * const auto half_turn = Quaternion(0.0, 0.0, 0.0, 3.14159).exp();
 * @endcode
 */
#pragma once

#include <array>

#include "mcm/common/math.hpp"

namespace mcm::linalg
{

/**
 * @brief quaternion value type
 *
 * ✨ PURE FUNCTION ✨ semantics throughout. equality is bit-pattern equality.
 */
class Quaternion
{
  public:
    constexpr Quaternion(double a, double b, double c, double d) noexcept : a_(a), b_(b), c_(c), d_(d) {}

    [[nodiscard]] static constexpr auto zero() noexcept -> Quaternion { return {0.0, 0.0, 0.0, 0.0}; }
    [[nodiscard]] static constexpr auto one() noexcept -> Quaternion { return {1.0, 0.0, 0.0, 0.0}; }
    [[nodiscard]] static constexpr auto i() noexcept -> Quaternion { return {0.0, 1.0, 0.0, 0.0}; }
    [[nodiscard]] static constexpr auto j() noexcept -> Quaternion { return {0.0, 0.0, 1.0, 0.0}; }
    [[nodiscard]] static constexpr auto k() noexcept -> Quaternion { return {0.0, 0.0, 0.0, 1.0}; }

    /// real (scalar) part
    [[nodiscard]] constexpr auto a() const noexcept -> double { return a_; }
    [[nodiscard]] constexpr auto b() const noexcept -> double { return b_; }
    [[nodiscard]] constexpr auto c() const noexcept -> double { return c_; }
    [[nodiscard]] constexpr auto d() const noexcept -> double { return d_; }

    /**
     * @brief Hamilton product this * that (ij = k, jk = i, ki = j)
     *
     * ✨ PURE FUNCTION ✨
     */
    [[nodiscard]] constexpr auto product(const Quaternion &that) const noexcept -> Quaternion
    {
        return {(a_ * that.a_) - (b_ * that.b_) - (c_ * that.c_) - (d_ * that.d_),
                (a_ * that.b_) + (b_ * that.a_) + (c_ * that.d_) - (d_ * that.c_),
                (a_ * that.c_) - (b_ * that.d_) + (c_ * that.a_) + (d_ * that.b_),
                (a_ * that.d_) + (b_ * that.c_) - (c_ * that.b_) + (d_ * that.a_)};
    }

    [[nodiscard]] constexpr auto conjugate() const noexcept -> Quaternion { return {a_, -b_, -c_, -d_}; }

    [[nodiscard]] constexpr auto plus(const Quaternion &that) const noexcept -> Quaternion
    {
        return {a_ + that.a_, b_ + that.b_, c_ + that.c_, d_ + that.d_};
    }

    [[nodiscard]] constexpr auto minus(const Quaternion &that) const noexcept -> Quaternion
    {
        return {a_ - that.a_, b_ - that.b_, c_ - that.c_, d_ - that.d_};
    }

    [[nodiscard]] constexpr auto scale(double f) const noexcept -> Quaternion
    {
        return {a_ * f, b_ * f, c_ * f, d_ * f};
    }

    [[nodiscard]] constexpr auto mean(const Quaternion &that) const noexcept -> Quaternion
    {
        return {(a_ + that.a_) * 0.5, (b_ + that.b_) * 0.5, (c_ + that.c_) * 0.5, (d_ + that.d_) * 0.5};
    }

    /// 4-D Euclidean inner product
    [[nodiscard]] constexpr auto dot(const Quaternion &that) const noexcept -> double
    {
        return (a_ * that.a_) + (b_ * that.b_) + (c_ * that.c_) + (d_ * that.d_);
    }

    /// the pure-vector part (0, b, c, d)
    [[nodiscard]] constexpr auto vector() const noexcept -> Quaternion { return {0.0, b_, c_, d_}; }

    [[nodiscard]] auto norm2() const noexcept -> double { return common::scaled_magnitude2(components()); }
    [[nodiscard]] auto norm() const noexcept -> double { return common::scaled_magnitude(components()); }

    /// norm of the difference
    [[nodiscard]] auto distance(const Quaternion &that) const noexcept -> double { return minus(that).norm(); }

    /// conjugate / norm^2; the zero quaternion gives non-finite components
    [[nodiscard]] auto reciprocal() const noexcept -> Quaternion;

    /// unit quaternion in the same direction, or zero() when the norm is not a normal number
    [[nodiscard]] auto versor() const noexcept -> Quaternion;

    [[nodiscard]] auto exp() const noexcept -> Quaternion;

    /**
     * @brief ln|q| + versor(vector part) * acos(a / |q|)
     *
     * on the negative real axis the vector part is zero, so its versor is
     * zero too and the pi term is lost: Quaternion(-1, 0, 0, 0).log() is zero
     * and exp() of that is one. pow() shares the same blind spot.
     */
    [[nodiscard]] auto log() const noexcept -> Quaternion;

    /**
     * @brief real power via the polar form |q|^p exp(p theta n)
     *
     * ✨ PURE FUNCTION ✨
     *
     * n is the unit vector part and theta = atan2(|v|, a). scalars keep a
     * zero vector part so pow() of a positive real stays real.
     */
    [[nodiscard]] auto pow(double p) const noexcept -> Quaternion;

    /**
     * @brief this * p * this^-1 (rotates the vector part of p when this is a versor)
     */
    [[nodiscard]] auto conjugation(const Quaternion &p) const noexcept -> Quaternion;

    [[nodiscard]] friend constexpr auto operator==(const Quaternion &lhs, const Quaternion &rhs) noexcept -> bool
    {
        return common::bit_equal(lhs.a_, rhs.a_) && common::bit_equal(lhs.b_, rhs.b_) &&
               common::bit_equal(lhs.c_, rhs.c_) && common::bit_equal(lhs.d_, rhs.d_);
    }

  private:
    [[nodiscard]] constexpr auto components() const noexcept -> std::array<double, 4> { return {a_, b_, c_, d_}; }

    double a_;
    double b_;
    double c_;
    double d_;
};

} // namespace mcm::linalg
