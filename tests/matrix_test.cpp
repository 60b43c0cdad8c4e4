/**
 * @file matrix_test.cpp
 * @brief dense matrix algebra smoke tests
 */
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include "mcm/linalg/matrix.hpp"

using mcm::linalg::Matrix;
using mcm::linalg::MutableMatrix;
using mcm::linalg::Vector;
using testing::ElementsAre;

namespace
{

[[nodiscard]] auto values(const Vector &v) -> std::vector<double>
{
    return {v.components().begin(), v.components().end()};
}

[[nodiscard]] auto make_two_by_three() -> Matrix
{
    return Matrix(2U, 3U, {1.0, 2.0, 3.0, 4.0, 5.0, 6.0});
}

} // namespace

/**
 * @test elements are stored row-major and checked access guards both indices
 */
TEST(MatrixBasics, RowMajorAccess)
{
    const auto m = make_two_by_three();
    EXPECT_EQ(m.rows(), 2U);
    EXPECT_EQ(m.columns(), 3U);
    EXPECT_DOUBLE_EQ(m(0U, 2U), 3.0);
    EXPECT_DOUBLE_EQ(m.get(1U, 0U), 4.0);
    EXPECT_THROW((void)m.get(2U, 0U), std::out_of_range);
    EXPECT_THROW((void)m.get(0U, 3U), std::out_of_range);
}

/**
 * @test construction rejects empty shapes and element count mismatches
 */
TEST(MatrixBasics, RejectsBadShapes)
{
    EXPECT_THROW(Matrix(0U, 3U, {}), std::invalid_argument);
    EXPECT_THROW(Matrix(2U, 2U, {1.0, 2.0, 3.0}), std::invalid_argument);
    EXPECT_THROW(MutableMatrix(3U, 0U), std::invalid_argument);
}

/**
 * @test matrix-vector product is the row-wise dot product
 */
TEST(MatrixAlgebra, MultiplyVector)
{
    const auto m = make_two_by_three();
    EXPECT_THAT(values(m.multiply(Vector{1.0, 0.0, -1.0})), ElementsAre(-2.0, -2.0));
    EXPECT_THROW((void)m.multiply(Vector{1.0, 2.0}), std::invalid_argument);
}

/**
 * @test element-wise operations keep shape and refuse mismatched operands
 */
TEST(MatrixAlgebra, ElementWiseOperations)
{
    const auto m   = make_two_by_three();
    const auto sum = m.plus(m);
    EXPECT_EQ(sum, m.scale(2.0));
    EXPECT_EQ(sum.minus(m), m);
    EXPECT_EQ(m.mean(m.minus()), Matrix::zero(2U, 3U));
    EXPECT_THROW((void)m.plus(Matrix::zero(3U, 2U)), std::invalid_argument);
}

/**
 * @test mutable matrices fill cell by cell and freeze into values
 */
TEST(MutableMatrixTest, FillAndFreeze)
{
    MutableMatrix j(2U, 2U);
    j.set(0U, 0U, 2.0);
    j.set(1U, 1U, 3.0);
    EXPECT_THAT(values(j.multiply(Vector{1.0, 1.0})), ElementsAre(2.0, 3.0));
    EXPECT_THROW(j.set(2U, 0U, 1.0), std::out_of_range);

    const Matrix frozen = j.freeze();
    j.set(0U, 1U, 9.0);
    EXPECT_DOUBLE_EQ(frozen(0U, 1U), 0.0);
    EXPECT_DOUBLE_EQ(MutableMatrix(frozen).get(1U, 1U), 3.0);
}
