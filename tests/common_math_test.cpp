#include <array>
#include <cmath>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <limits>
#include <vector>

#include "mcm/common/error.hpp"
#include "mcm/common/math.hpp"

using testing::DoubleNear;
using testing::HasSubstr;

namespace
{

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kMax = std::numeric_limits<double>::max();

} // namespace

/**
 * @test bit equality is reflexive even for NaN but splits the two zeros
 */
TEST(CommonMathBitEqual, NaNEqualsItselfAndZerosDiffer)
{
    EXPECT_TRUE(mcm::common::bit_equal(kNaN, kNaN));
    EXPECT_FALSE(mcm::common::bit_equal(0.0, -0.0));
    EXPECT_TRUE(mcm::common::bit_equal(1.5, 1.5));

    const std::array<double, 3> lhs{1.0, kNaN, -0.0};
    const std::array<double, 3> same{1.0, kNaN, -0.0};
    const std::array<double, 3> other{1.0, kNaN, 0.0};
    EXPECT_TRUE(mcm::common::bit_equal(lhs, same));
    EXPECT_FALSE(mcm::common::bit_equal(lhs, other));
}

/**
 * @test spans of different lengths are never bit-equal
 */
TEST(CommonMathBitEqual, LengthMismatchIsUnequal)
{
    const std::array<double, 2> shorter{1.0, 2.0};
    const std::array<double, 3> longer{1.0, 2.0, 3.0};
    EXPECT_FALSE(mcm::common::bit_equal(shorter, longer));
}

/**
 * @test the scaled magnitude survives components whose squares overflow
 */
TEST(CommonMathMagnitude, HugeComponentsDoNotOverflow)
{
    const std::array<double, 2> huge{kMax * 0.5, kMax * 0.5};
    const double                magnitude = mcm::common::scaled_magnitude(huge);
    EXPECT_TRUE(std::isfinite(magnitude));
    EXPECT_THAT(magnitude / (kMax * 0.5), DoubleNear(std::sqrt(2.0), 1.0e-12));
}

/**
 * @test the scaled magnitude survives components whose squares underflow
 */
TEST(CommonMathMagnitude, TinyComponentsDoNotUnderflow)
{
    const std::array<double, 2> tiny{3.0e-200, 4.0e-200};
    EXPECT_THAT(mcm::common::scaled_magnitude(tiny) / 1.0e-200, DoubleNear(5.0, 1.0e-12));
}

/**
 * @test zero vectors have zero magnitude rather than 0/0
 */
TEST(CommonMathMagnitude, ZeroVectorHasZeroMagnitude)
{
    const std::array<double, 3> zero{0.0, 0.0, 0.0};
    EXPECT_EQ(mcm::common::scaled_magnitude2(zero), 0.0);
    EXPECT_EQ(mcm::common::scaled_magnitude(zero), 0.0);
}

/**
 * @test max_abs reports NaN when any component is NaN
 */
TEST(CommonMathMaxAbs, PropagatesNaN)
{
    const std::array<double, 3> values{1.0, -7.0, 2.0};
    EXPECT_DOUBLE_EQ(mcm::common::max_abs(values), 7.0);

    const std::array<double, 3> with_nan{1.0, kNaN, 2.0};
    EXPECT_TRUE(std::isnan(mcm::common::max_abs(with_nan)));
}

/**
 * @test breadcrumbs stack outermost first and render in describe()
 */
TEST(CommonError, WithContextPrependsBreadcrumb)
{
    const auto inner = mcm::make_error(mcm::ErrorKind::PoorlyConditioned, "stalled", {"find_brent"});
    const auto outer = mcm::with_context(inner.error(), "minimise_along_line");

    EXPECT_TRUE(mcm::is_poorly_conditioned(outer.error()));
    ASSERT_EQ(outer.error().context.size(), 2U);
    EXPECT_EQ(outer.error().context.front(), "minimise_along_line");
    EXPECT_THAT(mcm::describe(outer.error()), HasSubstr("stalled"));
    EXPECT_THAT(mcm::describe(outer.error()), HasSubstr("minimise_along_line > find_brent"));
}
