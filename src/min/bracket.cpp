/**
 * @file bracket.cpp
 * @brief Bracket invariant checks
 */
#include "mcm/min/bracket.hpp"

#include <stdexcept>

#include <fmt/core.h>

namespace mcm::min
{

Bracket::Bracket(const Function1Value &left, const Function1Value &inner, const Function1Value &right)
    : left_(left), inner_(inner), right_(right)
{
    // negated comparisons so NaN fails
    if (!(left.x < inner.x))
    {
        throw std::invalid_argument(
            fmt::format("inner ({}, {}) not to the right of left ({}, {})", inner.x, inner.f, left.x, left.f));
    }
    if (!(inner.x < right.x))
    {
        throw std::invalid_argument(
            fmt::format("right ({}, {}) not to the right of inner ({}, {})", right.x, right.f, inner.x, inner.f));
    }
    if (!(inner.f < left.f))
    {
        throw std::invalid_argument(
            fmt::format("inner ({}, {}) not below left ({}, {})", inner.x, inner.f, left.x, left.f));
    }
    if (!(inner.f < right.f))
    {
        throw std::invalid_argument(
            fmt::format("inner ({}, {}) not below right ({}, {})", inner.x, inner.f, right.x, right.f));
    }
}

} // namespace mcm::min
