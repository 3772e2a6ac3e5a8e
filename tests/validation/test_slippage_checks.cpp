/// @file tests/validation/test_slippage_checks.cpp
/// @brief Tests for slippage_consistent.

#include "dxg/validation.hpp"

#include <gtest/gtest.h>

using namespace dxg;
using namespace dxg::validation;

TEST(SlippageConsistent, TightBoundsPass) {
    EXPECT_FALSE(slippage_consistent(100, 200, 95, 190).has_value());
}

TEST(SlippageConsistent, MinEqualToDesiredPasses) {
    EXPECT_FALSE(slippage_consistent(100, 200, 100, 200).has_value());
}

TEST(SlippageConsistent, BothSidesZeroPass) {
    // desired = 0 means the zero minimum is not a slippage hole.
    EXPECT_FALSE(slippage_consistent(0, 0, 0, 0).has_value());
}

TEST(SlippageConsistent, MinAboveDesiredOnAFails) {
    auto s = slippage_consistent(100, 200, 101, 190);
    ASSERT_TRUE(s.has_value());
    ASSERT_TRUE(std::holds_alternative<InsufficientLiquidityAmounts>(*s));
    const auto& v = std::get<InsufficientLiquidityAmounts>(*s);
    EXPECT_EQ(v.amount_a, 100u);
    EXPECT_EQ(v.amount_b, 200u);
    EXPECT_EQ(v.min_a, 101u);
    EXPECT_EQ(v.min_b, 190u);
}

TEST(SlippageConsistent, MinAboveDesiredOnBFails) {
    auto s = slippage_consistent(100, 200, 95, 201);
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(std::holds_alternative<InsufficientLiquidityAmounts>(*s));
}

TEST(SlippageConsistent, ZeroMinAgainstNonzeroDesiredIsInvalidSlippage) {
    // amountADesired = 100, amountAMin = 0
    auto s = slippage_consistent(100, 200, 0, 190);
    ASSERT_TRUE(s.has_value());
    ASSERT_TRUE(std::holds_alternative<InvalidSlippage>(*s));
    EXPECT_EQ(std::get<InvalidSlippage>(*s).got, 0u);
    EXPECT_EQ(std::get<InvalidSlippage>(*s).min, 1u);
}

TEST(SlippageConsistent, ZeroMinOnBIsInvalidSlippage) {
    auto s = slippage_consistent(100, 200, 95, 0);
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(std::holds_alternative<InvalidSlippage>(*s));
}

TEST(SlippageConsistent, OrderingCheckedBeforeZeroMinimum) {
    // Side A has a zero minimum, side B has min > desired. Ordering wins.
    auto s = slippage_consistent(100, 200, 0, 201);
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(std::holds_alternative<InsufficientLiquidityAmounts>(*s));
}

TEST(SlippageConsistent, ZeroDesiredWithZeroMinOnOneSideOnly) {
    // Side A is empty (0/0), side B is tight.
    EXPECT_FALSE(slippage_consistent(0, 200, 0, 150).has_value());
}
