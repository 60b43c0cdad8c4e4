/**
 * @file math.hpp
 * @brief bit-exact comparisons + overflow-proof norms shared by every mcm vector flavour uwu
 *
 * this header centralizes the tiny slice of dimension-generic algebra that the
 * vector, matrix and quaternion types all lean on: dot products, scaled sums of
 * squares, and the bit-pattern equality helper that gives our value types their
 * NaN-equals-NaN semantics. every helper works over std::span<const double> so
 * the 1-D, 3-D and N-D vectors share one implementation instead of three
 * slightly different ones.
 *
 * the big idea: expose tiny pure functions that can be inlined everywhere so
 * the linear algebra stays readable without paying abstraction tax. magnitudes
 * are computed relative to the largest component, so 1e200 and 1e-200
 * components neither overflow nor flush to zero before the square root.
 *
 * @author LukeFrankio
 * @date 2025-11-05
 * @version 1.1
 *
 * @note compiled in -std=c++23 mode (std::bit_cast + std::span)
 * @note pure header, zero runtime allocation
 *
 * example (basic usage):
 * @code
 * using namespace mcm::common;
 * const std::array<double, 3> a{1.0, 0.0, 0.0};
 * const std::array<double, 3> b{0.0, 1.0, 0.0};
 * const auto d = dot(a, b);
 * // d == 0.0 and bit_equal(a, a) holds even when a holds NaNs uwu
 * @endcode
 */
#pragma once

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <numbers>
#include <span>

namespace mcm::common
{

/// smallest positive normal double; below this we treat magnitudes as degenerate
inline constexpr double kMinNormal = std::numeric_limits<double>::min();

/// unit in the last place of 1.0
inline constexpr double kUlpOne = std::numeric_limits<double>::epsilon();

/// golden ratio, the expansion factor for bracket search and golden-section steps
inline constexpr double kGolden = std::numbers::phi;

/**
 * @brief compares two doubles by bit pattern instead of IEEE equality
 *
 * ✨ PURE FUNCTION ✨
 *
 * this function is pure because:
 * - deterministic reinterpretation of the bits, no state touched
 * - noexcept and constexpr so value-type operator== stays cheap
 *
 * NaN == NaN (same payload) and +0.0 != -0.0 under this relation. that is the
 * value-semantics contract all mcm value types expose.
 *
 * @param[in] lhs first value
 * @param[in] rhs second value
 * @return true when the two doubles have identical bit patterns
 */
[[nodiscard]] constexpr auto bit_equal(double lhs, double rhs) noexcept -> bool
{
    return std::bit_cast<std::uint64_t>(lhs) == std::bit_cast<std::uint64_t>(rhs);
}

/**
 * @brief element-wise bit_equal over two spans (length mismatch compares false)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto bit_equal(std::span<const double> lhs, std::span<const double> rhs) noexcept -> bool
{
    if (lhs.size() != rhs.size())
    {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i)
    {
        if (!bit_equal(lhs[i], rhs[i]))
        {
            return false;
        }
    }
    return true;
}

/**
 * @brief plain dot product; caller guarantees equal lengths
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] lhs left operand
 * @param[in] rhs right operand (same length as lhs)
 * @return sum of pairwise products (NaN/inf propagate per IEEE 754)
 *
 * @complexity O(n) time, O(1) space
 */
[[nodiscard]] constexpr auto dot(std::span<const double> lhs, std::span<const double> rhs) noexcept -> double
{
    double sum = 0.0;
    for (std::size_t i = 0; i < lhs.size(); ++i)
    {
        sum += lhs[i] * rhs[i];
    }
    return sum;
}

/**
 * @brief largest absolute component (the scale used by the norm helpers)
 *
 * ✨ PURE FUNCTION ✨
 *
 * a NaN component makes the scale NaN so norms propagate it
 */
[[nodiscard]] inline auto max_abs(std::span<const double> values) noexcept -> double
{
    double scale = 0.0;
    for (const double value : values)
    {
        if (std::isnan(value))
        {
            return value;
        }
        scale = std::max(scale, std::abs(value));
    }
    return scale;
}

/**
 * @brief sum of squares computed relative to the largest component
 *
 * ✨ PURE FUNCTION ✨
 *
 * this function is pure because:
 * - input fully determines output, no hidden state
 * - no exceptions, no logging, no side effects whatsoever
 *
 * when the scale is zero, subnormal, infinite or NaN the scale squared is
 * returned directly: zero stays zero and infinities stay infinite instead of
 * turning into NaN through inf/inf.
 *
 * @param[in] values components
 * @return sum of squares (>= 0, or NaN when a component is NaN)
 */
[[nodiscard]] inline auto scaled_magnitude2(std::span<const double> values) noexcept -> double
{
    const double scale  = max_abs(values);
    const double scale2 = scale * scale;
    if (!std::isfinite(scale) || scale < kMinNormal)
    {
        return scale2;
    }
    const double inv = 1.0 / scale;
    double       m2  = 0.0;
    for (const double value : values)
    {
        const double scaled = value * inv;
        m2 += scaled * scaled;
    }
    return m2 * scale2;
}

/**
 * @brief Euclidean magnitude with the same scaling trick as scaled_magnitude2
 *
 * ✨ PURE FUNCTION ✨
 *
 * @post return value >= 0.0 (never negative) unless a component is NaN
 *
 * @note unlike sqrt(scaled_magnitude2) this never overflows for components
 *       around 1e200
 */
[[nodiscard]] inline auto scaled_magnitude(std::span<const double> values) noexcept -> double
{
    const double scale = max_abs(values);
    if (!std::isfinite(scale) || scale < kMinNormal)
    {
        return scale;
    }
    const double inv = 1.0 / scale;
    double       m2  = 0.0;
    for (const double value : values)
    {
        const double scaled = value * inv;
        m2 += scaled * scaled;
    }
    return std::sqrt(m2) * scale;
}

} // namespace mcm::common
