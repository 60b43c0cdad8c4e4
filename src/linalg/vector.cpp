/**
 * @file vector.cpp
 * @brief N-D + mutable vector implementations
 */
#include "mcm/linalg/vector.hpp"

#include <algorithm>
#include <utility>

#include <fmt/core.h>

namespace mcm::linalg
{
namespace detail
{

void throw_dimension_mismatch(std::size_t lhs, std::size_t rhs, const char *operation)
{
    throw std::invalid_argument(fmt::format("{}: inconsistent dimensions {} and {}", operation, lhs, rhs));
}

void throw_index_out_of_range(std::size_t index, std::size_t dimension)
{
    throw std::out_of_range(fmt::format("index {} out of range for dimension {}", index, dimension));
}

} // namespace detail

namespace
{

[[nodiscard]] auto require_non_empty(std::vector<double> components) -> std::vector<double>
{
    if (components.empty())
    {
        throw std::invalid_argument("vector dimension must be > 0");
    }
    return components;
}

template <typename Op>
[[nodiscard]] auto combine(std::span<const double> lhs, std::span<const double> rhs, const char *operation, Op op)
    -> std::vector<double>
{
    detail::require_same_dimension(lhs.size(), rhs.size(), operation);
    std::vector<double> result(lhs.size());
    for (std::size_t i = 0; i < lhs.size(); ++i)
    {
        result[i] = op(lhs[i], rhs[i]);
    }
    return result;
}

template <typename Op>
[[nodiscard]] auto map_values(std::span<const double> values, Op op) -> std::vector<double>
{
    std::vector<double> result(values.size());
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        result[i] = op(values[i]);
    }
    return result;
}

constexpr auto kAdd  = [](double a, double b) { return a + b; };
constexpr auto kSub  = [](double a, double b) { return a - b; };
constexpr auto kMean = [](double a, double b) { return (a + b) * 0.5; };
constexpr auto kNeg  = [](double a) { return -a; };

} // namespace

// ---------------------------------------------------------------- Vector

Vector::Vector(std::vector<double> components) : components_(require_non_empty(std::move(components))) {}

Vector::Vector(std::initializer_list<double> components)
    : components_(require_non_empty(std::vector<double>(components)))
{
}

auto Vector::zero(std::size_t dimension) -> Vector
{
    return Vector(std::vector<double>(dimension, 0.0));
}

auto Vector::basis(std::size_t dimension, std::size_t index) -> Vector
{
    detail::require_index(index, dimension);
    std::vector<double> e(dimension, 0.0);
    e[index] = 1.0;
    return Vector(std::move(e));
}

auto Vector::on_line(const Vector &x0, const Vector &dx, double w) -> Vector
{
    return Vector(combine(x0.components_, dx.components_, "on_line", [w](double a, double b) { return a + (w * b); }));
}

auto Vector::get(std::size_t i) const -> double
{
    detail::require_index(i, components_.size());
    return components_[i];
}

auto Vector::dot(const Vector &that) const -> double
{
    detail::require_same_dimension(dimension(), that.dimension(), "dot");
    return common::dot(components_, that.components_);
}

auto Vector::plus(const Vector &that) const -> Vector
{
    return Vector(combine(components_, that.components_, "plus", kAdd));
}

auto Vector::minus(const Vector &that) const -> Vector
{
    return Vector(combine(components_, that.components_, "minus", kSub));
}

auto Vector::minus() const -> Vector
{
    return Vector(map_values(components_, kNeg));
}

auto Vector::scale(double f) const -> Vector
{
    return Vector(map_values(components_, [f](double a) { return a * f; }));
}

auto Vector::mean(const Vector &that) const -> Vector
{
    return Vector(combine(components_, that.components_, "mean", kMean));
}

auto Vector::to_vector3() const -> Vector3
{
    detail::require_same_dimension(dimension(), 3U, "to_vector3");
    return Vector3{components_[0], components_[1], components_[2]};
}

auto sum(std::span<const Vector> vectors) -> Vector
{
    if (vectors.empty())
    {
        throw std::invalid_argument("sum: no vectors");
    }
    std::vector<double> total(vectors.front().dimension(), 0.0);
    for (const auto &v : vectors)
    {
        detail::require_same_dimension(total.size(), v.dimension(), "sum");
        for (std::size_t i = 0; i < total.size(); ++i)
        {
            total[i] += v[i];
        }
    }
    return Vector(std::move(total));
}

auto weighted_sum(std::span<const double> weights, std::span<const Vector> vectors) -> Vector
{
    if (weights.empty())
    {
        throw std::invalid_argument("weighted_sum: no weights");
    }
    detail::require_same_dimension(weights.size(), vectors.size(), "weighted_sum (weights vs vectors)");
    std::vector<double> total(vectors.front().dimension(), 0.0);
    for (std::size_t j = 0; j < vectors.size(); ++j)
    {
        detail::require_same_dimension(total.size(), vectors[j].dimension(), "weighted_sum");
        for (std::size_t i = 0; i < total.size(); ++i)
        {
            total[i] += weights[j] * vectors[j][i];
        }
    }
    return Vector(std::move(total));
}

// ---------------------------------------------------------------- MutableVector

MutableVector::MutableVector(std::size_t dimension) : components_(require_non_empty(std::vector<double>(dimension, 0.0)))
{
}

MutableVector::MutableVector(const Vector &initial) : components_(initial.components().begin(), initial.components().end())
{
}

MutableVector::MutableVector(std::initializer_list<double> components)
    : components_(require_non_empty(std::vector<double>(components)))
{
}

auto MutableVector::get(std::size_t i) const -> double
{
    detail::require_index(i, components_.size());
    return components_[i];
}

void MutableVector::set(std::size_t i, double value)
{
    detail::require_index(i, components_.size());
    components_[i] = value;
}

auto MutableVector::dot(const MutableVector &that) const -> double
{
    detail::require_same_dimension(dimension(), that.dimension(), "dot");
    return common::dot(components_, that.components_);
}

auto MutableVector::dot(const Vector &that) const -> double
{
    detail::require_same_dimension(dimension(), that.dimension(), "dot");
    return common::dot(components_, that.components());
}

auto MutableVector::plus(const MutableVector &that) const -> MutableVector
{
    MutableVector result(*this);
    result.components_ = combine(components_, that.components_, "plus", kAdd);
    return result;
}

auto MutableVector::minus(const MutableVector &that) const -> MutableVector
{
    MutableVector result(*this);
    result.components_ = combine(components_, that.components_, "minus", kSub);
    return result;
}

auto MutableVector::minus() const -> MutableVector
{
    MutableVector result(*this);
    result.scale_in_place(-1.0);
    return result;
}

auto MutableVector::scale(double f) const -> MutableVector
{
    MutableVector result(*this);
    result.scale_in_place(f);
    return result;
}

auto MutableVector::mean(const MutableVector &that) const -> MutableVector
{
    MutableVector result(*this);
    result.components_ = combine(components_, that.components_, "mean", kMean);
    return result;
}

void MutableVector::assign(const Vector &value)
{
    detail::require_same_dimension(dimension(), value.dimension(), "assign");
    std::copy(value.components().begin(), value.components().end(), components_.begin());
}

void MutableVector::assign(const MutableVector &value)
{
    detail::require_same_dimension(dimension(), value.dimension(), "assign");
    components_ = value.components_;
}

void MutableVector::add_scaled(double w, const MutableVector &dx)
{
    detail::require_same_dimension(dimension(), dx.dimension(), "add_scaled");
    for (std::size_t i = 0; i < components_.size(); ++i)
    {
        components_[i] += w * dx.components_[i];
    }
}

void MutableVector::scale_in_place(double f) noexcept
{
    for (auto &value : components_)
    {
        value *= f;
    }
}

auto MutableVector::freeze() const -> Vector
{
    return Vector(components_);
}

} // namespace mcm::linalg
