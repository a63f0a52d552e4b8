#include <gtest/gtest.h>
#include <cmath>
#include "ammsim/math/fixed_point.hpp"

using namespace ammsim;
using namespace ammsim::math;

namespace {

Int e18(unsigned long long v) { return Int(v) * Fixed::PRECISION(); }

// |a - b| <= tol
::testing::AssertionResult within(const Int& a, const Int& b, const Int& tol) {
    if (abs_int(a - b) <= tol) return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure() << a.str() << " vs " << b.str() << " (tol " << tol.str() << ")";
}

} // namespace

// ============================================================================
// Integer roots
// ============================================================================

TEST(FixedPointTest, IsqrtFloors) {
    EXPECT_EQ(isqrt(Int(0)), Int(0));
    EXPECT_EQ(isqrt(Int(1)), Int(1));
    EXPECT_EQ(isqrt(Int(16)), Int(4));
    EXPECT_EQ(isqrt(Int(17)), Int(4));
    EXPECT_EQ(isqrt(Int(99)), Int(9));
    EXPECT_EQ(isqrt(pow10(40)), pow10(20));
}

TEST(FixedPointTest, SqrtIntIsScaled) {
    EXPECT_TRUE(within(sqrt_int(e18(4)), e18(2), Int(1)));
    EXPECT_TRUE(within(sqrt_int(e18(2500)), e18(50), Int(1)));
    EXPECT_TRUE(within(sqrt_int(Fixed::PRECISION()), Fixed::PRECISION(), Int(1)));
}

TEST(FixedPointTest, Log2OfPowersOfTwo) {
    EXPECT_EQ(log2_256(Int(0)), 0u);
    EXPECT_EQ(log2_256(Int(1)), 0u);
    EXPECT_EQ(log2_256(Int(1024)), 10u);
    EXPECT_EQ(log2_256(Int(1025)), 10u);
    EXPECT_EQ(log2_256(Int(1) << 200), 200u);
}

TEST(FixedPointTest, CbrtIsScaled) {
    EXPECT_TRUE(within(cbrt(e18(8)), e18(2), Int(2)));
    EXPECT_TRUE(within(cbrt(e18(27000)), e18(30), Int(30)));
    EXPECT_EQ(cbrt(Int(0)), Int(0));
}

// ============================================================================
// Geometric means
// ============================================================================

TEST(FixedPointTest, GeometricMeanTwoValues) {
    EXPECT_TRUE(within(geometric_mean2({e18(4), e18(1)}, true), e18(2), Int(2)));
    // Order does not matter once sorted
    EXPECT_EQ(geometric_mean2({e18(1), e18(4)}, true), geometric_mean2({e18(4), e18(1)}, true));
}

TEST(FixedPointTest, GeometricMeanThreeValues) {
    const Int g = geometric_mean3({e18(1000), e18(1000), e18(1000)});
    EXPECT_TRUE(within(g, e18(1000), e18(1) / 1000000));
}

TEST(FixedPointTest, GeometricMeanDispatchesOnSize) {
    EXPECT_EQ(geometric_mean({e18(9), e18(4)}), geometric_mean2({e18(9), e18(4)}, true));
    EXPECT_EQ(geometric_mean({e18(8), e18(8), e18(8)}), geometric_mean3({e18(8), e18(8), e18(8)}));
}

// ============================================================================
// Exponentials
// ============================================================================

TEST(FixedPointTest, HalfpowHalvesPerUnit) {
    EXPECT_EQ(halfpow(Int(0)), Fixed::PRECISION());
    EXPECT_TRUE(within(halfpow(Fixed::PRECISION()), Fixed::PRECISION() / 2, Int(1000000)));
    EXPECT_TRUE(within(halfpow(2 * Fixed::PRECISION()), Fixed::PRECISION() / 4, Int(1000000)));
}

// ============================================================================
// Integer helpers
// ============================================================================

TEST(FixedPointTest, FloorDivRoundsDown) {
    EXPECT_EQ(floor_div(Int(7), Int(2)), Int(3));
    EXPECT_EQ(floor_div(Int(-7), Int(2)), Int(-4));
    EXPECT_EQ(floor_div(Int(7), Int(-2)), Int(-4));
    EXPECT_EQ(floor_div(Int(-8), Int(2)), Int(-4));
}

TEST(FixedPointTest, FromDoubleDropsNonFinite) {
    EXPECT_EQ(from_double(std::nan("")), Int(0));
    EXPECT_EQ(from_double(1.9), Int(1));
    EXPECT_EQ(from_double(1e21), pow10(21));
}
