/// @file tests/validation/test_identity_checks.cpp
/// @brief Tests for identity_exists, identity_not_protected, token_pair_valid
///        and recipient_valid.

#include "dxg/validation.hpp"

#include <gtest/gtest.h>

using namespace dxg;
using namespace dxg::validation;

namespace {

const Address kAlice   = Address::from_tag(0xA1);
const Address kBob     = Address::from_tag(0xB0);
const Address kFactory = Address::from_tag(0xF0);
const Address kRouter  = Address::from_tag(0xE0);

/// The address carried by an InvalidAddress status.
Address offending(const Status& s) {
    return std::get<InvalidAddress>(*s).address;
}

}  // anonymous namespace

// ─── identity_exists ──────────────────────────────────────────────────────────

TEST(IdentityExists, NonNullPasses) {
    EXPECT_FALSE(identity_exists(kAlice).has_value());
}

TEST(IdentityExists, NullFailsWithInvalidAddress) {
    auto s = identity_exists(Address::zero());
    ASSERT_TRUE(s.has_value());
    ASSERT_TRUE(std::holds_alternative<InvalidAddress>(*s));
    EXPECT_TRUE(offending(s).is_zero());
}

// ─── identity_not_protected ───────────────────────────────────────────────────

TEST(IdentityNotProtected, DifferentAddressPasses) {
    EXPECT_FALSE(identity_not_protected(kAlice, kFactory).has_value());
}

TEST(IdentityNotProtected, ProtectedAddressFails) {
    auto s = identity_not_protected(kFactory, kFactory);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(offending(s), kFactory);
}

// ─── token_pair_valid ─────────────────────────────────────────────────────────

TEST(TokenPairValid, DistinctTokensPass) {
    EXPECT_FALSE(token_pair_valid(kAlice, kBob).has_value());
}

TEST(TokenPairValid, NullFirstTokenReportsFirst) {
    auto s = token_pair_valid(Address::zero(), kBob);
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(offending(s).is_zero());
}

TEST(TokenPairValid, NullSecondTokenReportsSecond) {
    auto s = token_pair_valid(kAlice, Address::zero());
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(offending(s).is_zero());
}

TEST(TokenPairValid, IdenticalTokensFail) {
    auto s = token_pair_valid(kAlice, kAlice);
    ASSERT_TRUE(s.has_value());
    ASSERT_TRUE(std::holds_alternative<InvalidAddress>(*s));
    EXPECT_EQ(offending(s), kAlice);
}

TEST(TokenPairValid, BothNullFailsOnExistenceFirst) {
    auto s = token_pair_valid(Address::zero(), Address::zero());
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(offending(s).is_zero());
}

// ─── recipient_valid ──────────────────────────────────────────────────────────

TEST(RecipientValid, OrdinaryAccountPasses) {
    EXPECT_FALSE(recipient_valid(kAlice, kFactory, kRouter).has_value());
}

TEST(RecipientValid, NullRecipientFails) {
    auto s = recipient_valid(Address::zero(), kFactory, kRouter);
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(offending(s).is_zero());
}

TEST(RecipientValid, FactoryRecipientFails) {
    auto s = recipient_valid(kFactory, kFactory, kRouter);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(offending(s), kFactory);
}

TEST(RecipientValid, RouterRecipientFails) {
    auto s = recipient_valid(kRouter, kFactory, kRouter);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(offending(s), kRouter);
}
