/// @file tests/validation/test_composite_checks.cpp
/// @brief Tests for liquidity_amounts_valid and swap_amounts_valid.

#include "dxg/validation.hpp"

#include <gtest/gtest.h>

using namespace dxg;
using namespace dxg::validation;
using namespace dxg::constants;

namespace {

const Address A = Address::from_tag(0x0A);
const Address B = Address::from_tag(0x0B);
const Address C = Address::from_tag(0x0C);

}  // anonymous namespace

// ─── liquidity_amounts_valid ──────────────────────────────────────────────────

TEST(LiquidityAmountsValid, HealthyDepositPasses) {
    EXPECT_FALSE(liquidity_amounts_valid(10'000, 20'000, 9'500, 19'000).has_value());
}

TEST(LiquidityAmountsValid, ZeroDesiredAFailsFirst) {
    // Both desired are zero; amountA is checked first.
    auto s = liquidity_amounts_valid(0, 0, 0, 0);
    ASSERT_TRUE(s.has_value());
    ASSERT_TRUE(std::holds_alternative<InvalidAmount>(*s));
    EXPECT_EQ(std::get<InvalidAmount>(*s).got, 0u);
    EXPECT_EQ(std::get<InvalidAmount>(*s).min, 1u);
}

TEST(LiquidityAmountsValid, ZeroDesiredBFails) {
    auto s = liquidity_amounts_valid(10'000, 0, 9'000, 0);
    ASSERT_TRUE(s.has_value());
    ASSERT_TRUE(std::holds_alternative<InvalidAmount>(*s));
    EXPECT_EQ(std::get<InvalidAmount>(*s).max, MAX_AMOUNT);
}

TEST(LiquidityAmountsValid, SlippageCheckedBeforeFloor) {
    // 100 is below the floor, but the zero minimum is reported first.
    auto s = liquidity_amounts_valid(100, 20'000, 0, 19'000);
    ASSERT_TRUE(s.has_value());
    ASSERT_TRUE(std::holds_alternative<InvalidSlippage>(*s));
    EXPECT_EQ(std::get<InvalidSlippage>(*s).got, 0u);
    EXPECT_EQ(std::get<InvalidSlippage>(*s).min, 1u);
}

TEST(LiquidityAmountsValid, BelowFloorOnAFails) {
    auto s = liquidity_amounts_valid(999, 20'000, 990, 19'000);
    ASSERT_TRUE(s.has_value());
    ASSERT_TRUE(std::holds_alternative<InvalidAmount>(*s));
    const auto& v = std::get<InvalidAmount>(*s);
    EXPECT_EQ(v.got, 999u);
    EXPECT_EQ(v.min, MINIMUM_LIQUIDITY);
    EXPECT_EQ(v.max, MAX_AMOUNT);
}

TEST(LiquidityAmountsValid, BelowFloorOnBFails) {
    auto s = liquidity_amounts_valid(20'000, 500, 19'000, 400);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(std::get<InvalidAmount>(*s).got, 500u);
}

TEST(LiquidityAmountsValid, CustomFloor) {
    EXPECT_FALSE(liquidity_amounts_valid(10, 10, 5, 5, 10).has_value());
    EXPECT_TRUE(liquidity_amounts_valid(9, 10, 5, 5, 10).has_value());
}

// ─── swap_amounts_valid ───────────────────────────────────────────────────────

TEST(SwapAmountsValid, ZeroOutMinIsAccepted) {
    Path path{A, B};
    EXPECT_FALSE(swap_amounts_valid(1'000, 0, path).has_value());
}

TEST(SwapAmountsValid, ZeroAmountInFailsBeforePath) {
    Path path{A};  // also a bad path
    auto s = swap_amounts_valid(0, 0, path);
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(std::holds_alternative<InvalidAmount>(*s));
}

TEST(SwapAmountsValid, DuplicatePathIsReported) {
    Path path{A, B, A};
    auto s = swap_amounts_valid(1'000, 1, path, 3);
    ASSERT_TRUE(s.has_value());
    ASSERT_TRUE(std::holds_alternative<DuplicateAddressInPath>(*s));
    EXPECT_EQ(std::get<DuplicateAddressInPath>(*s).i, 0u);
    EXPECT_EQ(std::get<DuplicateAddressInPath>(*s).j, 2u);
}

TEST(SwapAmountsValid, PathLengthBoundIsForwarded) {
    Path path{A, B, C};
    EXPECT_FALSE(swap_amounts_valid(1, 1, path, 3).has_value());
    auto s = swap_amounts_valid(1, 1, path, 2);
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(std::holds_alternative<InvalidPath>(*s));
}
