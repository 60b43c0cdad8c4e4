/**
 * @file matrix.hpp
 * @brief dense row-major matrices (immutable + mutable scratch) uwu
 *
 * the Jacobian approximation writes its columns into a MutableMatrix and
 * freezes it; everything downstream only ever sees the immutable Matrix.
 * storage is a flat row-major std::vector, same layout the CG solver's dense
 * operator has always used, so multiply() is just a row-wise dot product.
 *
 * invariants:
 * - rows() > 0 and columns() > 0
 * - elements().size() == rows() * columns()
 * - equality is bit-pattern equality over (rows, columns, elements)
 */
#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "mcm/linalg/vector.hpp"

namespace mcm::linalg
{

/**
 * @brief immutable dense matrix
 */
class Matrix
{
  public:
    /**
     * @brief wrap row-major elements
     *
     * @throws std::invalid_argument if rows or columns is 0 or
     *         elements.size() != rows * columns
     */
    Matrix(std::size_t rows, std::size_t columns, std::vector<double> elements);

    [[nodiscard]] static auto zero(std::size_t rows, std::size_t columns) -> Matrix;

    [[nodiscard]] auto rows() const noexcept -> std::size_t { return rows_; }
    [[nodiscard]] auto columns() const noexcept -> std::size_t { return columns_; }

    /// unchecked element access
    [[nodiscard]] auto operator()(std::size_t i, std::size_t j) const noexcept -> double
    {
        return elements_[(i * columns_) + j];
    }

    /// @throws std::out_of_range if i >= rows() or j >= columns()
    [[nodiscard]] auto get(std::size_t i, std::size_t j) const -> double;

    [[nodiscard]] auto elements() const noexcept -> std::span<const double> { return elements_; }

    [[nodiscard]] auto plus(const Matrix &that) const -> Matrix;
    [[nodiscard]] auto minus(const Matrix &that) const -> Matrix;
    [[nodiscard]] auto minus() const -> Matrix;
    [[nodiscard]] auto scale(double f) const -> Matrix;

    /// element-wise average of two same-shape matrices
    [[nodiscard]] auto mean(const Matrix &that) const -> Matrix;

    /**
     * @brief A x via row-wise dot products
     *
     * ✨ PURE FUNCTION ✨
     *
     * @throws std::invalid_argument unless x.dimension() == columns()
     * @return vector of dimension rows()
     */
    [[nodiscard]] auto multiply(const Vector &x) const -> Vector;

    [[nodiscard]] friend auto operator==(const Matrix &lhs, const Matrix &rhs) noexcept -> bool
    {
        return lhs.rows_ == rhs.rows_ && lhs.columns_ == rhs.columns_ &&
               common::bit_equal(lhs.elements_, rhs.elements_);
    }

  private:
    std::size_t         rows_;
    std::size_t         columns_;
    std::vector<double> elements_;
};

/**
 * @brief writable matrix for assembling results element by element
 *
 * ⚠️ NOT THREAD SAFE
 */
class MutableMatrix
{
  public:
    /// zero matrix; @throws std::invalid_argument if rows or columns is 0
    MutableMatrix(std::size_t rows, std::size_t columns);

    explicit MutableMatrix(const Matrix &initial);

    [[nodiscard]] auto rows() const noexcept -> std::size_t { return rows_; }
    [[nodiscard]] auto columns() const noexcept -> std::size_t { return columns_; }

    [[nodiscard]] auto get(std::size_t i, std::size_t j) const -> double;

    /// @throws std::out_of_range if i >= rows() or j >= columns()
    void set(std::size_t i, std::size_t j, double value);

    [[nodiscard]] auto multiply(const Vector &x) const -> Vector;

    [[nodiscard]] auto freeze() const -> Matrix;

  private:
    std::size_t         rows_;
    std::size_t         columns_;
    std::vector<double> elements_;
};

} // namespace mcm::linalg
