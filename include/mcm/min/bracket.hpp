/**
 * @file bracket.hpp
 * @brief three sampled points certifying that a 1-D minimum lies between the outer two
 */
#pragma once

#include "mcm/min/function.hpp"

namespace mcm::min
{

/**
 * @brief ordered three-point bracket of a minimum
 *
 * invariants (checked at construction, NaN fails every check):
 * - left.x < inner.x < right.x
 * - inner.f < left.f and inner.f < right.f
 */
class Bracket
{
  public:
    /// @throws std::invalid_argument if the points violate the invariants
    Bracket(const Function1Value &left, const Function1Value &inner, const Function1Value &right);

    [[nodiscard]] auto left() const noexcept -> const Function1Value & { return left_; }
    [[nodiscard]] auto inner() const noexcept -> const Function1Value & { return inner_; }
    [[nodiscard]] auto right() const noexcept -> const Function1Value & { return right_; }

    /// right.x - left.x (always > 0)
    [[nodiscard]] auto width() const noexcept -> double { return right_.x - left_.x; }

    /// the smallest sampled value, inner.f
    [[nodiscard]] auto min() const noexcept -> double { return inner_.f; }

    /**
     * @brief whether three points would form a valid bracket
     *
     * ✨ PURE FUNCTION ✨ lets searches test a candidate without a try/catch
     */
    [[nodiscard]] static auto is_valid(const Function1Value &left, const Function1Value &inner,
                                       const Function1Value &right) noexcept -> bool
    {
        return left.x < inner.x && inner.x < right.x && inner.f < left.f && inner.f < right.f;
    }

    [[nodiscard]] friend auto operator==(const Bracket &lhs, const Bracket &rhs) noexcept -> bool
    {
        return lhs.left_ == rhs.left_ && lhs.inner_ == rhs.inner_ && lhs.right_ == rhs.right_;
    }

  private:
    Function1Value left_;
    Function1Value inner_;
    Function1Value right_;
};

} // namespace mcm::min
