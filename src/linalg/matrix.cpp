/**
 * @file matrix.cpp
 * @brief dense matrix implementation (row-major, CG-style apply)
 */
#include "mcm/linalg/matrix.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/core.h>

namespace mcm::linalg
{
namespace
{

void require_shape(std::size_t rows, std::size_t columns, std::size_t count)
{
    if (rows == 0U || columns == 0U)
    {
        throw std::invalid_argument(fmt::format("matrix shape {}x{} must be non-empty", rows, columns));
    }
    if (count != rows * columns)
    {
        throw std::invalid_argument(
            fmt::format("matrix shape {}x{} inconsistent with {} elements", rows, columns, count));
    }
}

void require_same_shape(const Matrix &lhs, const Matrix &rhs, const char *operation)
{
    detail::require_same_dimension(lhs.rows(), rhs.rows(), operation);
    detail::require_same_dimension(lhs.columns(), rhs.columns(), operation);
}

[[nodiscard]] auto apply_matrix(std::span<const double> matrix, std::size_t rows, std::size_t columns,
                                const Vector &vector) -> Vector
{
    detail::require_same_dimension(columns, vector.dimension(), "multiply");
    std::vector<double> result(rows, 0.0);
    for (std::size_t row = 0; row < rows; ++row)
    {
        result[row] = common::dot(matrix.subspan(row * columns, columns), vector.components());
    }
    return Vector(std::move(result));
}

} // namespace

Matrix::Matrix(std::size_t rows, std::size_t columns, std::vector<double> elements)
    : rows_(rows), columns_(columns), elements_(std::move(elements))
{
    require_shape(rows_, columns_, elements_.size());
}

auto Matrix::zero(std::size_t rows, std::size_t columns) -> Matrix
{
    return Matrix(rows, columns, std::vector<double>(rows * columns, 0.0));
}

auto Matrix::get(std::size_t i, std::size_t j) const -> double
{
    detail::require_index(i, rows_);
    detail::require_index(j, columns_);
    return (*this)(i, j);
}

auto Matrix::plus(const Matrix &that) const -> Matrix
{
    require_same_shape(*this, that, "plus");
    std::vector<double> result(elements_.size());
    for (std::size_t k = 0; k < result.size(); ++k)
    {
        result[k] = elements_[k] + that.elements_[k];
    }
    return Matrix(rows_, columns_, std::move(result));
}

auto Matrix::minus(const Matrix &that) const -> Matrix
{
    require_same_shape(*this, that, "minus");
    std::vector<double> result(elements_.size());
    for (std::size_t k = 0; k < result.size(); ++k)
    {
        result[k] = elements_[k] - that.elements_[k];
    }
    return Matrix(rows_, columns_, std::move(result));
}

auto Matrix::minus() const -> Matrix
{
    return scale(-1.0);
}

auto Matrix::scale(double f) const -> Matrix
{
    std::vector<double> result = elements_;
    for (auto &value : result)
    {
        value *= f;
    }
    return Matrix(rows_, columns_, std::move(result));
}

auto Matrix::mean(const Matrix &that) const -> Matrix
{
    require_same_shape(*this, that, "mean");
    std::vector<double> result(elements_.size());
    for (std::size_t k = 0; k < result.size(); ++k)
    {
        result[k] = (elements_[k] + that.elements_[k]) * 0.5;
    }
    return Matrix(rows_, columns_, std::move(result));
}

auto Matrix::multiply(const Vector &x) const -> Vector
{
    return apply_matrix(elements_, rows_, columns_, x);
}

MutableMatrix::MutableMatrix(std::size_t rows, std::size_t columns)
    : rows_(rows), columns_(columns), elements_(rows * columns, 0.0)
{
    require_shape(rows_, columns_, elements_.size());
}

MutableMatrix::MutableMatrix(const Matrix &initial)
    : rows_(initial.rows()), columns_(initial.columns()),
      elements_(initial.elements().begin(), initial.elements().end())
{
}

auto MutableMatrix::get(std::size_t i, std::size_t j) const -> double
{
    detail::require_index(i, rows_);
    detail::require_index(j, columns_);
    return elements_[(i * columns_) + j];
}

void MutableMatrix::set(std::size_t i, std::size_t j, double value)
{
    detail::require_index(i, rows_);
    detail::require_index(j, columns_);
    elements_[(i * columns_) + j] = value;
}

auto MutableMatrix::multiply(const Vector &x) const -> Vector
{
    return apply_matrix(elements_, rows_, columns_, x);
}

auto MutableMatrix::freeze() const -> Matrix
{
    return Matrix(rows_, columns_, elements_);
}

} // namespace mcm::linalg
