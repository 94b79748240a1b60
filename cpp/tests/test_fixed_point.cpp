#include "fixed_point.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace eclp;
using eclp_test::units;

TEST(FixedPoint, MulRoundsInRequestedDirection) {
    uint256 third("333333333333333333");  // 0.333...
    EXPECT_EQ(fp::mul_down(third, uint256(3)), uint256(0));
    EXPECT_EQ(fp::mul_up(third, uint256(3)), uint256(1));
    EXPECT_EQ(fp::mul_down(units(2), units(3)), units(6));
    EXPECT_EQ(fp::mul_up(units(2), units(3)), units(6));
    EXPECT_EQ(fp::mul_up(uint256(0), units(3)), uint256(0));
}

TEST(FixedPoint, DivRoundsInRequestedDirection) {
    EXPECT_EQ(fp::div_down(units(1), units(3)), uint256("333333333333333333"));
    EXPECT_EQ(fp::div_up(units(1), units(3)), uint256("333333333333333334"));
    EXPECT_EQ(fp::div_up(uint256(0), units(3)), uint256(0));
    EXPECT_EQ(fp::div_down(units(6), units(3)), units(2));
}

TEST(FixedPoint, DivByZeroThrows) {
    EXPECT_POOL_ERROR(fp::div_down(units(1), 0), Errc::ZeroDivision);
    EXPECT_POOL_ERROR(fp::div_up(units(1), 0), Errc::ZeroDivision);
}

TEST(FixedPoint, ComplementSaturates) {
    EXPECT_EQ(fp::complement(uint256("10000000000000000")), uint256("990000000000000000"));
    EXPECT_EQ(fp::complement(fp::ONE()), uint256(0));
    EXPECT_EQ(fp::complement(units(2)), uint256(0));
}

TEST(FixedPoint, DoubleConversionsBracketTheValue) {
    uint256 down = fp::from_double_down(1.5);
    uint256 up = fp::from_double_up(1.5);
    EXPECT_EQ(down, uint256("1500000000000000000"));
    EXPECT_EQ(up, down);

    EXPECT_EQ(fp::from_double_down(-3.0), uint256(0));
    EXPECT_EQ(fp::from_double_up(0.0), uint256(0));
    EXPECT_LE(fp::from_double_down(0.1), fp::from_double_up(0.1));
    EXPECT_DOUBLE_EQ(fp::to_double(units(42)), 42.0);
}

TEST(FixedPoint, SignConversions) {
    EXPECT_EQ(to_signed(units(5)), int256("5000000000000000000"));
    EXPECT_EQ(to_unsigned(int256(7)), uint256(7));
    EXPECT_POOL_ERROR(to_unsigned(int256(-1)), Errc::CurveDomainViolation);
}

TEST(PoolErrors, MessageCarriesCodeName) {
    PoolError e(Errc::CapExceeded, "global cap exceeded");
    EXPECT_EQ(e.code(), Errc::CapExceeded);
    EXPECT_STREQ(e.what(), "CapExceeded: global cap exceeded");
}
