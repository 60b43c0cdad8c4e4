/**
 * @file vector_test.cpp
 * @brief fixed, dynamic and mutable vector algebra checks
 */
#include <array>
#include <cmath>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <limits>
#include <span>
#include <stdexcept>
#include <vector>

#include "mcm/linalg/vector.hpp"

using mcm::linalg::MutableVector;
using mcm::linalg::Vector;
using mcm::linalg::Vector3;
using testing::DoubleNear;
using testing::ElementsAre;

namespace
{

constexpr double kEps = 1.0e-12;

[[nodiscard]] auto values(std::span<const double> components) -> std::vector<double>
{
    return {components.begin(), components.end()};
}

[[nodiscard]] auto values(const Vector &v) -> std::vector<double>
{
    return values(v.components());
}

[[nodiscard]] auto values(const MutableVector &v) -> std::vector<double>
{
    return values(v.components());
}

[[nodiscard]] auto make_samples() -> std::vector<Vector>
{
    return {Vector{0.0, 0.0, 0.0}, Vector{1.0, -2.0, 3.5}, Vector{-4.0, 2.0, -1.5}, Vector{1.0e8, 1.0e-8, 7.0}};
}

} // namespace

/**
 * @test (a + b) - b lands back on a within rounding for every sample pair
 */
TEST(VectorAlgebra, PlusThenMinusRecoversOperand)
{
    const auto samples = make_samples();
    for (const auto &a : samples)
    {
        for (const auto &b : samples)
        {
            const Vector back = a.plus(b).minus(b);
            for (std::size_t i = 0; i < a.dimension(); ++i)
            {
                EXPECT_THAT(back[i], DoubleNear(a[i], 1.0e-7 * std::max(1.0, std::abs(b[i]))));
            }
        }
    }
}

/**
 * @test scaling by one is an exact identity, negation is scaling by -1
 */
TEST(VectorAlgebra, ScaleByOneIsIdentity)
{
    for (const auto &v : make_samples())
    {
        EXPECT_EQ(v.scale(1.0), v);
        EXPECT_EQ(v.minus(), v.scale(-1.0));
    }
}

/**
 * @test mean, dot and magnitude agree with hand-computed values
 */
TEST(VectorAlgebra, MeanDotAndMagnitude)
{
    const Vector a{3.0, 4.0};
    const Vector b{1.0, 0.0};

    EXPECT_THAT(values(a.mean(b)), ElementsAre(2.0, 2.0));
    EXPECT_DOUBLE_EQ(a.dot(b), 3.0);
    EXPECT_DOUBLE_EQ(a.magnitude(), 5.0);
    EXPECT_DOUBLE_EQ(a.magnitude2(), 25.0);
}

/**
 * @test mixing dimensions is a programming error and throws
 */
TEST(VectorAlgebra, DimensionMismatchThrows)
{
    const Vector two{1.0, 2.0};
    const Vector three{1.0, 2.0, 3.0};

    EXPECT_THROW((void)two.plus(three), std::invalid_argument);
    EXPECT_THROW((void)two.minus(three), std::invalid_argument);
    EXPECT_THROW((void)two.dot(three), std::invalid_argument);
    EXPECT_THROW((void)two.mean(three), std::invalid_argument);
    EXPECT_THROW((void)three.to_vector3().dot(two), std::invalid_argument);
}

/**
 * @test empty vectors are refused and checked access rejects bad indices
 */
TEST(VectorAlgebra, EmptyAndOutOfRange)
{
    EXPECT_THROW(Vector(std::vector<double>{}), std::invalid_argument);
    EXPECT_THROW((void)Vector::zero(0U), std::invalid_argument);

    const Vector v{1.0, 2.0};
    EXPECT_DOUBLE_EQ(v.get(1U), 2.0);
    EXPECT_THROW((void)v.get(2U), std::out_of_range);
    EXPECT_THROW((void)Vector::basis(2U, 2U), std::out_of_range);
}

/**
 * @test basis vectors and points along a line
 */
TEST(VectorAlgebra, BasisAndOnLine)
{
    EXPECT_THAT(values(Vector::basis(3U, 1U)), ElementsAre(0.0, 1.0, 0.0));

    const Vector x0{1.0, 1.0};
    const Vector dx{2.0, -1.0};
    EXPECT_THAT(values(Vector::on_line(x0, dx, 0.5)), ElementsAre(2.0, 0.5));
    EXPECT_EQ(Vector::on_line(x0, dx, 0.0), x0);
}

/**
 * @test equality is bitwise: NaN matches itself, signed zeros differ
 */
TEST(VectorAlgebra, BitwiseEquality)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ((Vector{nan, 1.0}), (Vector{nan, 1.0}));
    EXPECT_NE((Vector{0.0}), (Vector{-0.0}));
    EXPECT_NE((Vector{1.0}), (Vector{1.0, 0.0}));
}

/**
 * @test sums reject empty and ragged input
 */
TEST(VectorSums, SumAndWeightedSum)
{
    const std::array<Vector, 3> vectors{Vector{1.0, 0.0}, Vector{0.0, 1.0}, Vector{1.0, 1.0}};
    const std::array<double, 3> weights{2.0, 3.0, -1.0};

    EXPECT_THAT(values(mcm::linalg::sum(vectors)), ElementsAre(2.0, 2.0));
    EXPECT_THAT(values(mcm::linalg::weighted_sum(weights, vectors)), ElementsAre(1.0, 2.0));

    const std::array<double, 2> too_few{1.0, 1.0};
    EXPECT_THROW((void)mcm::linalg::weighted_sum(too_few, vectors), std::invalid_argument);
    EXPECT_THROW((void)mcm::linalg::sum(std::span<const Vector>{}), std::invalid_argument);
}

/**
 * @test cross products of the basis follow the right-hand rule
 */
TEST(Vector3Algebra, CrossFollowsRightHandRule)
{
    EXPECT_EQ(mcm::linalg::cross(Vector3::i(), Vector3::j()), Vector3::k());
    EXPECT_EQ(mcm::linalg::cross(Vector3::j(), Vector3::k()), Vector3::i());
    EXPECT_EQ(mcm::linalg::cross(Vector3::k(), Vector3::i()), Vector3::j());

    const Vector3 a{1.0, 2.0, 3.0};
    const Vector3 b{-2.0, 0.5, 4.0};
    const Vector3 c = mcm::linalg::cross(a, b);
    EXPECT_THAT(c.dot(a), DoubleNear(0.0, kEps));
    EXPECT_THAT(c.dot(b), DoubleNear(0.0, kEps));
}

/**
 * @test fixed vectors convert to dynamic ones without losing bits
 */
TEST(Vector3Algebra, ConvertsToDynamicVector)
{
    const Vector3 a{1.0, -2.0, 0.25};
    const Vector  dynamic = a;
    EXPECT_EQ(dynamic.dimension(), 3U);
    EXPECT_EQ(dynamic.to_vector3(), a);
    EXPECT_THROW((void)(Vector{1.0, 2.0}.to_vector3()), std::invalid_argument);
    EXPECT_THROW((void)Vector3::basis(3U), std::out_of_range);
}

/**
 * @test in-place updates touch only the receiver and freeze snapshots it
 */
TEST(MutableVectorTest, InPlaceUpdates)
{
    MutableVector x{1.0, 2.0};
    MutableVector dx{0.5, -1.0};

    x.add_scaled(2.0, dx);
    EXPECT_THAT(values(x), ElementsAre(2.0, 0.0));
    EXPECT_THAT(values(dx), ElementsAre(0.5, -1.0));

    const Vector snapshot = x.freeze();
    x.scale_in_place(3.0);
    EXPECT_THAT(values(x), ElementsAre(6.0, 0.0));
    EXPECT_THAT(values(snapshot), ElementsAre(2.0, 0.0));

    x.set(1U, 4.0);
    EXPECT_DOUBLE_EQ(x.get(1U), 4.0);
    EXPECT_THROW(x.set(2U, 1.0), std::out_of_range);

    x.assign(Vector{7.0, 8.0});
    EXPECT_THAT(values(x), ElementsAre(7.0, 8.0));
    EXPECT_THROW(x.assign(Vector{1.0}), std::invalid_argument);
    EXPECT_THROW(x.add_scaled(1.0, MutableVector(3U)), std::invalid_argument);
}

/**
 * @test a fresh mutable vector starts at the origin
 */
TEST(MutableVectorTest, StartsAtZero)
{
    const MutableVector zero(3U);
    EXPECT_EQ(zero.freeze(), Vector::zero(3U));
    EXPECT_DOUBLE_EQ(zero.magnitude(), 0.0);
    EXPECT_THROW(MutableVector(0U), std::invalid_argument);
}
