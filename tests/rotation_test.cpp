/**
 * @file rotation_test.cpp
 * @brief Rotation3 and OrientationVectors3 behaviour
 */
#include <algorithm>
#include <cmath>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <numbers>
#include <stdexcept>

#include "mcm/linalg/orientation.hpp"
#include "mcm/linalg/rotation.hpp"

using mcm::linalg::OrientationVectors3;
using mcm::linalg::Quaternion;
using mcm::linalg::Rotation3;
using mcm::linalg::Vector;
using mcm::linalg::Vector3;
using testing::DoubleNear;

namespace
{

constexpr double kEps = 1.0e-12;

void expect_near(const Vector3 &actual, const Vector3 &expected, double tolerance)
{
    for (std::size_t i = 0; i < 3U; ++i)
    {
        EXPECT_THAT(actual[i], DoubleNear(expected[i], tolerance)) << "component " << i;
    }
}

} // namespace

/**
 * @test a quarter turn about x carries y onto z (right-hand rule)
 */
TEST(Rotation3Test, QuarterTurnAboutXMapsYToZ)
{
    const auto rotation = Rotation3::from_axis_angle(Vector3{1.0, 0.0, 0.0}, std::numbers::pi / 2.0);
    expect_near(rotation.apply(Vector3{0.0, 1.0, 0.0}), Vector3{0.0, 0.0, 1.0}, kEps);
    expect_near(rotation.apply(Vector3{0.0, 0.0, 1.0}), Vector3{0.0, -1.0, 0.0}, kEps);
    expect_near(rotation.apply(Vector3{1.0, 0.0, 0.0}), Vector3{1.0, 0.0, 0.0}, kEps);
}

/**
 * @test axis and angle read back what went in, with the axis normalised
 */
TEST(Rotation3Test, AxisAngleRoundTrip)
{
    const auto rotation = Rotation3::from_axis_angle(Vector3{0.0, 0.0, 2.0}, 0.75);
    EXPECT_THAT(rotation.angle(), DoubleNear(0.75, kEps));
    expect_near(rotation.axis(), Vector3{0.0, 0.0, 1.0}, kEps);
    EXPECT_THAT(rotation.versor().norm(), DoubleNear(1.0, kEps));
}

/**
 * @test rotations keep lengths
 */
TEST(Rotation3Test, PreservesMagnitude)
{
    const auto    rotation = Rotation3::from_axis_angle(Vector3{1.0, -2.0, 0.5}, 2.1);
    const Vector3 v{3.0, -1.0, 4.0};
    EXPECT_THAT(rotation.apply(v).magnitude(), DoubleNear(v.magnitude(), 1.0e-12 * v.magnitude()));
}

/**
 * @test undoing a rotation about a skew axis brings the vector back
 */
TEST(Rotation3Test, InverseUndoesRotation)
{
    const auto rotation = Rotation3::from_axis_angle(Vector3{1.0, -2.0, 0.5}, 2.1);
    for (const Vector3 &v : {Vector3{3.0, -1.0, 4.0}, Vector3{0.0, 0.0, 1.0}, Vector3{-1.0e3, 2.5, 7.0}})
    {
        const Vector3 round_trip = rotation.minus().apply(rotation.apply(v));
        expect_near(round_trip, v, 1.0e-13 * v.magnitude());
    }
}

/**
 * @test the zero rotation leaves vectors where they are
 */
TEST(Rotation3Test, ZeroRotationFixesEveryVector)
{
    const Rotation3 identity = Rotation3::zero();
    for (const Vector3 &v : {Vector3{3.0, -1.0, 4.0}, Vector3{0.0, 0.0, 0.0}, Vector3{-1.0e6, 1.0e-6, 2.0}})
    {
        expect_near(identity.apply(v), v, kEps * std::max(v.magnitude(), 1.0));
    }
}

/**
 * @test a zero angle is the identity whatever the axis, including a zero axis
 */
TEST(Rotation3Test, ZeroAngleIsIdentity)
{
    EXPECT_EQ(Rotation3::from_axis_angle(Vector3::zero(), 0.0), Rotation3::zero());
    EXPECT_EQ(Rotation3::from_axis_angle(Vector3{0.0, 1.0, 0.0}, 0.0), Rotation3::zero());
    EXPECT_DOUBLE_EQ(Rotation3::zero().angle(), 0.0);
    EXPECT_EQ(Rotation3::zero().axis(), Vector3::zero());
}

/**
 * @test a real rotation about a zero axis is meaningless and throws
 */
TEST(Rotation3Test, ZeroAxisWithAngleThrows)
{
    EXPECT_THROW((void)Rotation3::from_axis_angle(Vector3::zero(), 1.0), std::invalid_argument);
}

/**
 * @test quaternions are normalised on the way in; zero maps to the identity
 */
TEST(Rotation3Test, FromQuaternionNormalises)
{
    const auto rotation = Rotation3::from_quaternion(Quaternion(2.0, 0.0, 0.0, 0.0));
    EXPECT_EQ(rotation, Rotation3::zero());
    EXPECT_EQ(Rotation3::from_quaternion(Quaternion::zero()), Rotation3::zero());

    const auto half_turn = Rotation3::from_quaternion(Quaternion(0.0, 0.0, 3.0, 0.0));
    EXPECT_THAT(half_turn.angle(), DoubleNear(std::numbers::pi, kEps));
    expect_near(half_turn.apply(Vector3{1.0, 0.0, 0.0}), Vector3{-1.0, 0.0, 0.0}, kEps);
}

/**
 * @test composition, inverse, difference and fractional scaling
 */
TEST(Rotation3Test, GroupOperations)
{
    const auto    a = Rotation3::from_axis_angle(Vector3{0.0, 0.0, 1.0}, 0.4);
    const auto    b = Rotation3::from_axis_angle(Vector3{0.0, 0.0, 1.0}, 0.6);
    const Vector3 x{1.0, 0.0, 0.0};

    const auto composed = a.plus(b);
    EXPECT_THAT(composed.angle(), DoubleNear(1.0, kEps));
    expect_near(a.plus(a.minus()).apply(x), x, kEps);
    EXPECT_THAT(composed.minus(b).angle(), DoubleNear(0.4, kEps));
    EXPECT_THAT(composed.scale(0.5).angle(), DoubleNear(0.5, kEps));
    expect_near(composed.scale(0.5).axis(), Vector3{0.0, 0.0, 1.0}, kEps);
}

/**
 * @test the global basis is the identity frame
 */
TEST(OrientationVectors3Test, GlobalBasis)
{
    const auto basis = OrientationVectors3::global_basis();
    EXPECT_EQ(basis.e1(), (Vector{1.0, 0.0, 0.0}));
    EXPECT_EQ(basis.e2(), (Vector{0.0, 1.0, 0.0}));
    EXPECT_EQ(basis.e3(), (Vector{0.0, 0.0, 1.0}));
}

/**
 * @test a permuted basis is accepted, skewed or scaled ones are not
 */
TEST(OrientationVectors3Test, ValidatesOrthonormality)
{
    const Vector x{1.0, 0.0, 0.0};
    const Vector y{0.0, 1.0, 0.0};
    const Vector z{0.0, 0.0, 1.0};

    const auto permuted = OrientationVectors3::create_from_orthogonal_unit_basis_vectors(y, z, x);
    EXPECT_EQ(permuted.e1(), y);
    EXPECT_NE(permuted, OrientationVectors3::global_basis());

    EXPECT_THROW((void)OrientationVectors3::create_from_orthogonal_unit_basis_vectors(x, x, z),
                 std::invalid_argument);
    EXPECT_THROW((void)OrientationVectors3::create_from_orthogonal_unit_basis_vectors(x.scale(2.0), y, z),
                 std::invalid_argument);
    EXPECT_THROW((void)OrientationVectors3::create_from_orthogonal_unit_basis_vectors(Vector{1.0, 0.0}, y, z),
                 std::invalid_argument);
}
