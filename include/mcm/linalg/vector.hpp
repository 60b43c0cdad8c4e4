/**
 * @file vector.hpp
 * @brief value-semantics vectors (N-D, fixed 1-D/3-D, mutable scratch) that absolutely slap uwu
 *
 * three flavours, one algebra:
 * - Vector: immutable, dimension chosen at runtime (> 0)
 * - FixedVector<N> (Vector1, Vector3): immutable, std::array storage, no heap
 * - MutableVector: iteration scratch for the in-place minimisers
 *
 * every flavour routes its dot/norm/equality through the span helpers in
 * mcm/common/math.hpp, so they satisfy identical invariants by construction
 * instead of by copy-paste. equality is bit-pattern equality (NaN == NaN,
 * +0.0 != -0.0). arithmetic between mismatched dimensions throws
 * std::invalid_argument; checked indexing throws std::out_of_range.
 *
 * @author LukeFrankio
 * @date 2025-11-05
 * @version 1.1
 *
 * example (basic usage):
 * @code
 * using namespace mcm::linalg;
 * const Vector3 a{1.0, 0.0, 0.0};
 * const Vector3 b{0.0, 1.0, 0.0};
 * const auto c = cross(a, b);          // {0, 0, 1}, right handed
 * const Vector n = a;                  // widen to the N-D flavour
 * const auto m = n.plus(Vector{0.0, 2.0, 0.0}).magnitude();
 * @endcode
 */
#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "mcm/common/math.hpp"

namespace mcm::linalg
{

namespace detail
{

[[noreturn]] void throw_dimension_mismatch(std::size_t lhs, std::size_t rhs, const char *operation);
[[noreturn]] void throw_index_out_of_range(std::size_t index, std::size_t dimension);

inline void require_same_dimension(std::size_t lhs, std::size_t rhs, const char *operation)
{
    if (lhs != rhs)
    {
        throw_dimension_mismatch(lhs, rhs, operation);
    }
}

inline void require_index(std::size_t index, std::size_t dimension)
{
    if (index >= dimension)
    {
        throw_index_out_of_range(index, dimension);
    }
}

} // namespace detail

class Vector;

/**
 * @brief immutable fixed-dimension vector (no heap, constexpr friendly)
 *
 * ✨ PURE FUNCTION ✨ semantics throughout: every operation returns a new value.
 *
 * @tparam N dimension, > 0 (only Vector1 and Vector3 are used by the engine)
 */
template <std::size_t N>
class FixedVector
{
    static_assert(N > 0U, "vectors have at least one dimension");

  public:
    /// zero vector
    constexpr FixedVector() noexcept = default;

    /// one value per component, e.g. Vector3{x, y, z}
    template <typename... Ts>
        requires(sizeof...(Ts) == N && (std::convertible_to<Ts, double> && ...))
    constexpr explicit FixedVector(Ts... values) noexcept : components_{static_cast<double>(values)...}
    {
    }

    constexpr explicit FixedVector(const std::array<double, N> &components) noexcept : components_(components) {}

    [[nodiscard]] static constexpr auto zero() noexcept -> FixedVector { return FixedVector{}; }

    /// Vector3 axis constants
    [[nodiscard]] static constexpr auto i() noexcept -> FixedVector
        requires(N == 3U)
    {
        return FixedVector{1.0, 0.0, 0.0};
    }
    [[nodiscard]] static constexpr auto j() noexcept -> FixedVector
        requires(N == 3U)
    {
        return FixedVector{0.0, 1.0, 0.0};
    }
    [[nodiscard]] static constexpr auto k() noexcept -> FixedVector
        requires(N == 3U)
    {
        return FixedVector{0.0, 0.0, 1.0};
    }

    /// unit vector along axis `index`
    [[nodiscard]] static auto basis(std::size_t index) -> FixedVector
    {
        detail::require_index(index, N);
        FixedVector e{};
        e.components_[index] = 1.0;
        return e;
    }

    [[nodiscard]] static constexpr auto dimension() noexcept -> std::size_t { return N; }

    [[nodiscard]] constexpr auto operator[](std::size_t i) const noexcept -> double { return components_[i]; }

    [[nodiscard]] auto get(std::size_t i) const -> double
    {
        detail::require_index(i, N);
        return components_[i];
    }

    [[nodiscard]] constexpr auto components() const noexcept -> std::span<const double, N>
    {
        return std::span<const double, N>{components_};
    }

    [[nodiscard]] constexpr auto dot(const FixedVector &that) const noexcept -> double
    {
        return common::dot(components_, that.components_);
    }

    /// dot with an N-D vector; throws std::invalid_argument unless its dimension is N
    [[nodiscard]] auto dot(const Vector &that) const -> double;

    [[nodiscard]] auto magnitude() const noexcept -> double { return common::scaled_magnitude(components_); }
    [[nodiscard]] auto magnitude2() const noexcept -> double { return common::scaled_magnitude2(components_); }

    [[nodiscard]] constexpr auto plus(const FixedVector &that) const noexcept -> FixedVector
    {
        FixedVector result{};
        for (std::size_t i = 0; i < N; ++i)
        {
            result.components_[i] = components_[i] + that.components_[i];
        }
        return result;
    }

    [[nodiscard]] constexpr auto minus(const FixedVector &that) const noexcept -> FixedVector
    {
        FixedVector result{};
        for (std::size_t i = 0; i < N; ++i)
        {
            result.components_[i] = components_[i] - that.components_[i];
        }
        return result;
    }

    [[nodiscard]] constexpr auto minus() const noexcept -> FixedVector
    {
        FixedVector result{};
        for (std::size_t i = 0; i < N; ++i)
        {
            result.components_[i] = -components_[i];
        }
        return result;
    }

    [[nodiscard]] constexpr auto scale(double f) const noexcept -> FixedVector
    {
        FixedVector result{};
        for (std::size_t i = 0; i < N; ++i)
        {
            result.components_[i] = components_[i] * f;
        }
        return result;
    }

    [[nodiscard]] constexpr auto mean(const FixedVector &that) const noexcept -> FixedVector
    {
        FixedVector result{};
        for (std::size_t i = 0; i < N; ++i)
        {
            result.components_[i] = (components_[i] + that.components_[i]) * 0.5;
        }
        return result;
    }

    [[nodiscard]] friend constexpr auto operator==(const FixedVector &lhs, const FixedVector &rhs) noexcept -> bool
    {
        return common::bit_equal(lhs.components_, rhs.components_);
    }

  private:
    std::array<double, N> components_{};
};

using Vector1 = FixedVector<1U>;
using Vector3 = FixedVector<3U>;

/**
 * @brief right-handed cross product
 *
 * ✨ PURE FUNCTION ✨
 *
 * cross(i, j) == k, the same orientation Rotation3 uses.
 */
[[nodiscard]] constexpr auto cross(const Vector3 &lhs, const Vector3 &rhs) noexcept -> Vector3
{
    return Vector3{(lhs[1] * rhs[2]) - (lhs[2] * rhs[1]), (lhs[2] * rhs[0]) - (lhs[0] * rhs[2]),
                   (lhs[0] * rhs[1]) - (lhs[1] * rhs[0])};
}

/**
 * @brief immutable vector whose dimension is chosen at runtime
 *
 * invariants:
 * - dimension() > 0
 * - components never change after construction
 */
class Vector
{
  public:
    /// @throws std::invalid_argument if components is empty
    explicit Vector(std::vector<double> components);

    /// @throws std::invalid_argument if the list is empty
    Vector(std::initializer_list<double> components);

    /// widening conversion from a fixed-size vector
    template <std::size_t N>
    Vector(const FixedVector<N> &fixed) : components_(fixed.components().begin(), fixed.components().end())
    {
    }

    /// @throws std::invalid_argument if dimension == 0
    [[nodiscard]] static auto zero(std::size_t dimension) -> Vector;

    /// unit vector along `index` in `dimension` dimensions
    [[nodiscard]] static auto basis(std::size_t dimension, std::size_t index) -> Vector;

    /**
     * @brief the point x0 + w * dx
     *
     * ✨ PURE FUNCTION ✨
     *
     * the parameterisation every line search walks along.
     *
     * @throws std::invalid_argument if x0 and dx differ in dimension
     */
    [[nodiscard]] static auto on_line(const Vector &x0, const Vector &dx, double w) -> Vector;

    [[nodiscard]] auto dimension() const noexcept -> std::size_t { return components_.size(); }

    [[nodiscard]] auto operator[](std::size_t i) const noexcept -> double { return components_[i]; }

    [[nodiscard]] auto get(std::size_t i) const -> double;

    [[nodiscard]] auto components() const noexcept -> std::span<const double> { return components_; }

    [[nodiscard]] auto dot(const Vector &that) const -> double;
    [[nodiscard]] auto magnitude() const noexcept -> double { return common::scaled_magnitude(components_); }
    [[nodiscard]] auto magnitude2() const noexcept -> double { return common::scaled_magnitude2(components_); }

    [[nodiscard]] auto plus(const Vector &that) const -> Vector;
    [[nodiscard]] auto minus(const Vector &that) const -> Vector;
    [[nodiscard]] auto minus() const -> Vector;
    [[nodiscard]] auto scale(double f) const -> Vector;
    [[nodiscard]] auto mean(const Vector &that) const -> Vector;

    /// narrowing conversion; @throws std::invalid_argument unless dimension() == 3
    [[nodiscard]] auto to_vector3() const -> Vector3;

    [[nodiscard]] friend auto operator==(const Vector &lhs, const Vector &rhs) noexcept -> bool
    {
        return common::bit_equal(lhs.components_, rhs.components_);
    }

  private:
    std::vector<double> components_;
};

/**
 * @brief component-wise sum of one or more equal-dimension vectors
 *
 * @throws std::invalid_argument if vectors is empty or dimensions differ
 */
[[nodiscard]] auto sum(std::span<const Vector> vectors) -> Vector;

/**
 * @brief sum of weight[j] * vectors[j]
 *
 * @throws std::invalid_argument if weights is empty, the spans differ in
 *         length, or the vectors differ in dimension
 */
[[nodiscard]] auto weighted_sum(std::span<const double> weights, std::span<const Vector> vectors) -> Vector;

/**
 * @brief writable vector used as scratch state by the in-place minimisers
 *
 * ⚠️ NOT THREAD SAFE: a single instance must not be shared across threads
 * without external serialization. read-side algebra mirrors Vector exactly.
 */
class MutableVector
{
  public:
    /// zero vector; @throws std::invalid_argument if dimension == 0
    explicit MutableVector(std::size_t dimension);

    explicit MutableVector(const Vector &initial);

    /// @throws std::invalid_argument if the list is empty
    MutableVector(std::initializer_list<double> components);

    [[nodiscard]] auto dimension() const noexcept -> std::size_t { return components_.size(); }

    [[nodiscard]] auto operator[](std::size_t i) const noexcept -> double { return components_[i]; }
    [[nodiscard]] auto operator[](std::size_t i) noexcept -> double & { return components_[i]; }

    [[nodiscard]] auto get(std::size_t i) const -> double;
    void               set(std::size_t i, double value);

    [[nodiscard]] auto components() const noexcept -> std::span<const double> { return components_; }
    [[nodiscard]] auto components() noexcept -> std::span<double> { return components_; }

    [[nodiscard]] auto dot(const MutableVector &that) const -> double;
    [[nodiscard]] auto dot(const Vector &that) const -> double;
    [[nodiscard]] auto magnitude() const noexcept -> double { return common::scaled_magnitude(components_); }
    [[nodiscard]] auto magnitude2() const noexcept -> double { return common::scaled_magnitude2(components_); }

    [[nodiscard]] auto plus(const MutableVector &that) const -> MutableVector;
    [[nodiscard]] auto minus(const MutableVector &that) const -> MutableVector;
    [[nodiscard]] auto minus() const -> MutableVector;
    [[nodiscard]] auto scale(double f) const -> MutableVector;
    [[nodiscard]] auto mean(const MutableVector &that) const -> MutableVector;

    /// overwrite every component; @throws std::invalid_argument on dimension mismatch
    void assign(const Vector &value);
    void assign(const MutableVector &value);

    /// this += w * dx; @throws std::invalid_argument on dimension mismatch
    void add_scaled(double w, const MutableVector &dx);

    /// this *= f
    void scale_in_place(double f) noexcept;

    /// copy of the current state as an immutable Vector
    [[nodiscard]] auto freeze() const -> Vector;

    [[nodiscard]] friend auto operator==(const MutableVector &lhs, const MutableVector &rhs) noexcept -> bool
    {
        return common::bit_equal(lhs.components_, rhs.components_);
    }

  private:
    std::vector<double> components_;
};

template <std::size_t N>
auto FixedVector<N>::dot(const Vector &that) const -> double
{
    detail::require_same_dimension(N, that.dimension(), "dot");
    return common::dot(components_, that.components());
}

} // namespace mcm::linalg
