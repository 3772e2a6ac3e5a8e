/// @file tests/ownership/test_ownership_guard.cpp
/// @brief Tests for OwnershipGuard.

#include "dxg/ownership.hpp"

#include <gtest/gtest.h>

#include <type_traits>
#include <vector>

using namespace dxg;
using namespace dxg::ownership;

namespace {

const Address kAlice   = Address::from_tag(0xA1);
const Address kBob     = Address::from_tag(0xB0);
const Address kMallory = Address::from_tag(0x66);

/// Fixture: a guard owned by Alice that records every notification.
class OwnershipGuardTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto made = OwnershipGuard::create(kAlice, [this](const OwnershipTransferred& e) {
            events.push_back(e);
        });
        ASSERT_TRUE(std::holds_alternative<OwnershipGuard>(made));
        guard.emplace(std::move(std::get<OwnershipGuard>(made)));
    }

    std::optional<OwnershipGuard>     guard;
    std::vector<OwnershipTransferred> events;
};

}  // anonymous namespace

// ─── create ───────────────────────────────────────────────────────────────────

TEST(OwnershipGuardCreate, NullInitialOwnerIsInvalidAddress) {
    auto made = OwnershipGuard::create(Address::zero());
    ASSERT_TRUE(std::holds_alternative<Violation>(made));
    const auto& v = std::get<Violation>(made);
    ASSERT_TRUE(std::holds_alternative<InvalidAddress>(v));
    EXPECT_TRUE(std::get<InvalidAddress>(v).address.is_zero());
}

TEST(OwnershipGuardCreate, NullInitialOwnerEmitsNothing) {
    int calls = 0;
    auto made = OwnershipGuard::create(Address::zero(),
                                       [&](const OwnershipTransferred&) { ++calls; });
    EXPECT_TRUE(std::holds_alternative<Violation>(made));
    EXPECT_EQ(calls, 0);
}

TEST_F(OwnershipGuardTest, InitialNotificationFromNull) {
    EXPECT_EQ(guard->owner(), kAlice);
    EXPECT_FALSE(guard->is_renounced());
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(events[0].previous_owner.is_zero());
    EXPECT_EQ(events[0].new_owner, kAlice);
}

// ─── require_owner ────────────────────────────────────────────────────────────

TEST_F(OwnershipGuardTest, OwnerPassesGate) {
    EXPECT_FALSE(guard->require_owner(kAlice).has_value());
}

TEST_F(OwnershipGuardTest, StrangerIsUnauthorized) {
    auto s = guard->require_owner(kMallory);
    ASSERT_TRUE(s.has_value());
    ASSERT_TRUE(std::holds_alternative<Unauthorized>(*s));
    EXPECT_EQ(std::get<Unauthorized>(*s).caller, kMallory);
}

// ─── transfer_ownership ───────────────────────────────────────────────────────

TEST_F(OwnershipGuardTest, TransferMovesTheGate) {
    ASSERT_FALSE(guard->transfer_ownership(kAlice, kBob).has_value());

    EXPECT_EQ(guard->owner(), kBob);
    EXPECT_TRUE(guard->require_owner(kAlice).has_value());
    EXPECT_FALSE(guard->require_owner(kBob).has_value());

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].previous_owner, kAlice);
    EXPECT_EQ(events[1].new_owner, kBob);
}

TEST_F(OwnershipGuardTest, FormerOwnerCannotTransferBack) {
    ASSERT_FALSE(guard->transfer_ownership(kAlice, kBob).has_value());
    auto s = guard->transfer_ownership(kAlice, kAlice);
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(std::holds_alternative<Unauthorized>(*s));
    EXPECT_EQ(guard->owner(), kBob);
}

TEST_F(OwnershipGuardTest, TransferByStrangerChangesNothing) {
    auto s = guard->transfer_ownership(kMallory, kMallory);
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(std::holds_alternative<Unauthorized>(*s));
    EXPECT_EQ(guard->owner(), kAlice);
    EXPECT_EQ(events.size(), 1u);
}

TEST_F(OwnershipGuardTest, AuthorizationCheckedBeforeTarget) {
    // Stranger and null target: the caller is rejected first.
    auto s = guard->transfer_ownership(kMallory, Address::zero());
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(std::holds_alternative<Unauthorized>(*s));
}

TEST_F(OwnershipGuardTest, TransferToNullIsInvalidAddress) {
    auto s = guard->transfer_ownership(kAlice, Address::zero());
    ASSERT_TRUE(s.has_value());
    ASSERT_TRUE(std::holds_alternative<InvalidAddress>(*s));
    EXPECT_EQ(guard->owner(), kAlice);
    EXPECT_EQ(events.size(), 1u);
}

TEST_F(OwnershipGuardTest, TransferToSelfStillNotifies) {
    ASSERT_FALSE(guard->transfer_ownership(kAlice, kAlice).has_value());
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].previous_owner, kAlice);
    EXPECT_EQ(events[1].new_owner, kAlice);
}

// ─── renounce_ownership ───────────────────────────────────────────────────────

TEST_F(OwnershipGuardTest, RenounceIsTerminal) {
    ASSERT_FALSE(guard->renounce_ownership(kAlice).has_value());

    EXPECT_TRUE(guard->is_renounced());
    EXPECT_TRUE(guard->owner().is_zero());
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].previous_owner, kAlice);
    EXPECT_TRUE(events[1].new_owner.is_zero());

    // Nobody passes the gate afterwards, including the null address.
    EXPECT_TRUE(guard->require_owner(kAlice).has_value());
    EXPECT_TRUE(guard->require_owner(kBob).has_value());
    EXPECT_TRUE(guard->require_owner(Address::zero()).has_value());

    EXPECT_TRUE(guard->transfer_ownership(kAlice, kBob).has_value());
    EXPECT_TRUE(guard->transfer_ownership(Address::zero(), kBob).has_value());
    EXPECT_TRUE(guard->renounce_ownership(kAlice).has_value());
    EXPECT_EQ(events.size(), 2u);
}

TEST_F(OwnershipGuardTest, RenounceByStrangerFails) {
    auto s = guard->renounce_ownership(kMallory);
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(std::holds_alternative<Unauthorized>(*s));
    EXPECT_FALSE(guard->is_renounced());
}

// ─── subscribe ────────────────────────────────────────────────────────────────

TEST_F(OwnershipGuardTest, LateSubscriberSeesOnlyLaterChanges) {
    std::vector<OwnershipTransferred> late;
    guard->subscribe([&](const OwnershipTransferred& e) { late.push_back(e); });

    ASSERT_FALSE(guard->transfer_ownership(kAlice, kBob).has_value());

    ASSERT_EQ(late.size(), 1u);
    EXPECT_EQ(late[0].previous_owner, kAlice);
    EXPECT_EQ(late[0].new_owner, kBob);
    EXPECT_EQ(events.size(), 2u);
}

TEST_F(OwnershipGuardTest, ListenerObservesAppliedState) {
    Address seen{};
    const OwnershipGuard* g = &*guard;
    guard->subscribe([&](const OwnershipTransferred&) { seen = g->owner(); });

    ASSERT_FALSE(guard->transfer_ownership(kAlice, kBob).has_value());
    EXPECT_EQ(seen, kBob);
}

TEST_F(OwnershipGuardTest, ListenerMaySubscribeDuringNotification) {
    int added_calls = 0;
    guard->subscribe([&](const OwnershipTransferred&) {
        for (int k = 0; k < 8; ++k) {
            guard->subscribe([&](const OwnershipTransferred&) { ++added_calls; });
        }
    });

    ASSERT_FALSE(guard->transfer_ownership(kAlice, kBob).has_value());
    EXPECT_EQ(added_calls, 0);
    EXPECT_EQ(events.size(), 2u);

    // Only the listeners added during the first change (8) see this one;
    // the 8 added now do not.
    ASSERT_FALSE(guard->transfer_ownership(kBob, kAlice).has_value());
    EXPECT_EQ(added_calls, 8);
}

TEST_F(OwnershipGuardTest, ListenerMayRenounceDuringNotification) {
    guard->subscribe([&](const OwnershipTransferred& e) {
        if (e.new_owner == kBob) {
            EXPECT_FALSE(guard->renounce_ownership(kBob).has_value());
        }
    });

    ASSERT_FALSE(guard->transfer_ownership(kAlice, kBob).has_value());
    EXPECT_TRUE(guard->is_renounced());
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[1].new_owner, kBob);
    EXPECT_EQ(events[2].previous_owner, kBob);
    EXPECT_TRUE(events[2].new_owner.is_zero());
}

// ─── ownership of the cell ────────────────────────────────────────────────────

TEST(OwnershipGuardCell, MoveOnly) {
    static_assert(!std::is_copy_constructible_v<OwnershipGuard>);
    static_assert(!std::is_copy_assignable_v<OwnershipGuard>);
    static_assert(std::is_move_constructible_v<OwnershipGuard>);

    auto made = OwnershipGuard::create(kAlice);
    ASSERT_TRUE(std::holds_alternative<OwnershipGuard>(made));
    OwnershipGuard moved = std::move(std::get<OwnershipGuard>(made));
    EXPECT_EQ(moved.owner(), kAlice);
}
