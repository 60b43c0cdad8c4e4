/**
 * @file vector_field_test.cpp
 * @brief forward-difference Jacobian checks
 */
#include <cmath>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdexcept>

#include "mcm/field/vector_field.hpp"

using mcm::ErrorKind;
using mcm::field::VectorField;
using mcm::field::VectorFieldWithJacobianValue;
using mcm::linalg::Matrix;
using mcm::linalg::Vector;
using testing::DoubleNear;
using testing::ElementsAre;

namespace
{

/// (x + 2y, 3x - y, xy)
[[nodiscard]] auto make_field() -> VectorField
{
    return {2U, 3U, [](const Vector &x) {
                return Vector{x[0] + (2.0 * x[1]), (3.0 * x[0]) - x[1], x[0] * x[1]};
            }};
}

} // namespace

/**
 * @test a linear field has its coefficient matrix as Jacobian everywhere
 */
TEST(VectorFieldJacobian, LinearPartIsExactEnough)
{
    const Vector x{1.5, -2.0};
    const auto   value = mcm::field::approximate_at(make_field(), x);
    ASSERT_TRUE(value.has_value()) << mcm::describe(value.error());

    const Matrix &j = value->j();
    ASSERT_EQ(j.rows(), 3U);
    ASSERT_EQ(j.columns(), 2U);
    EXPECT_THAT(j(0U, 0U), DoubleNear(1.0, 1.0e-6));
    EXPECT_THAT(j(0U, 1U), DoubleNear(2.0, 1.0e-6));
    EXPECT_THAT(j(1U, 0U), DoubleNear(3.0, 1.0e-6));
    EXPECT_THAT(j(1U, 1U), DoubleNear(-1.0, 1.0e-6));
    // d(xy)/dx = y, d(xy)/dy = x
    EXPECT_THAT(j(2U, 0U), DoubleNear(-2.0, 1.0e-6));
    EXPECT_THAT(j(2U, 1U), DoubleNear(1.5, 1.0e-6));

    EXPECT_EQ(value->x(), x);
    EXPECT_EQ(value->f(), make_field().value(x));
}

/**
 * @test the field is sampled exactly once per column plus once at x
 */
TEST(VectorFieldJacobian, EvaluatesFieldNPlusOneTimes)
{
    int               calls = 0;
    const VectorField field{3U, 1U, [&calls](const Vector &x) {
                                ++calls;
                                return Vector{x[0] + x[1] + x[2]};
                            }};

    const auto value = mcm::field::approximate_at(field, Vector{0.0, 10.0, -1.0e6});
    ASSERT_TRUE(value.has_value()) << mcm::describe(value.error());
    EXPECT_EQ(calls, 4);
    for (std::size_t i = 0; i < 3U; ++i)
    {
        EXPECT_THAT(value->j()(0U, i), DoubleNear(1.0, 1.0e-6)) << "column " << i;
    }
}

/**
 * @test malformed fields and points are reported, not thrown
 */
TEST(VectorFieldJacobian, RejectsInvalidArguments)
{
    const auto wrong_point = mcm::field::approximate_at(make_field(), Vector{1.0, 2.0, 3.0});
    ASSERT_FALSE(wrong_point.has_value());
    EXPECT_EQ(wrong_point.error().kind, ErrorKind::InvalidArgument);
    EXPECT_THAT(wrong_point.error().context, ElementsAre("approximate_at"));

    const VectorField liar{2U, 2U, [](const Vector &x) { return Vector{x[0]}; }};
    const auto        wrong_output = mcm::field::approximate_at(liar, Vector{1.0, 2.0});
    ASSERT_FALSE(wrong_output.has_value());
    EXPECT_EQ(wrong_output.error().kind, ErrorKind::InvalidArgument);

    const VectorField empty{2U, 2U, {}};
    const auto        no_function = mcm::field::approximate_at(empty, Vector{1.0, 2.0});
    ASSERT_FALSE(no_function.has_value());
    EXPECT_EQ(no_function.error().kind, ErrorKind::InvalidArgument);
}

/**
 * @test the value type refuses a Jacobian of the wrong shape
 */
TEST(VectorFieldJacobian, ValueChecksShape)
{
    EXPECT_THROW(VectorFieldWithJacobianValue(Vector{1.0, 2.0}, Vector{1.0}, Matrix::zero(2U, 1U)),
                 std::invalid_argument);
    EXPECT_NO_THROW(VectorFieldWithJacobianValue(Vector{1.0, 2.0}, Vector{1.0}, Matrix::zero(1U, 2U)));
}
