/// @file src/ownership/ownership_guard.cpp
/// @brief OwnershipGuard implementation.

#include "dxg/ownership.hpp"

#include "dxg/validation.hpp"

#include <utility>

namespace dxg::ownership {

// ─── OwnershipGuard::create ───────────────────────────────────────────────────

GuardOrViolation OwnershipGuard::create(const Address& initial_owner,
                                        OwnershipListener listener) {
    if (auto v = validation::identity_exists(initial_owner)) {
        return *v;
    }

    OwnershipGuard guard;
    if (listener) {
        guard.listeners_.push_back(std::move(listener));
    }
    guard.set_owner(initial_owner);
    return guard;
}

// ─── OwnershipGuard::require_owner ────────────────────────────────────────────

Status OwnershipGuard::require_owner(const Address& caller) const noexcept {
    // After renouncement owner_ is null; the null caller must not match it.
    if (owner_.is_zero() || caller != owner_) {
        return Unauthorized{caller};
    }
    return std::nullopt;
}

// ─── OwnershipGuard::transfer_ownership ───────────────────────────────────────

Status OwnershipGuard::transfer_ownership(const Address& caller,
                                          const Address& new_owner) {
    if (auto v = require_owner(caller)) return v;
    if (auto v = validation::identity_exists(new_owner)) return v;

    set_owner(new_owner);
    return std::nullopt;
}

// ─── OwnershipGuard::renounce_ownership ───────────────────────────────────────

Status OwnershipGuard::renounce_ownership(const Address& caller) {
    if (auto v = require_owner(caller)) return v;

    set_owner(Address::zero());
    return std::nullopt;
}

// ─── OwnershipGuard::subscribe ────────────────────────────────────────────────

void OwnershipGuard::subscribe(OwnershipListener listener) {
    if (listener) {
        listeners_.push_back(std::move(listener));
    }
}

// ─── OwnershipGuard::set_owner ────────────────────────────────────────────────

void OwnershipGuard::set_owner(const Address& new_owner) {
    const OwnershipTransferred event{
        .previous_owner = owner_,
        .new_owner      = new_owner,
    };
    owner_ = new_owner;

    // Listeners may subscribe or change ownership while being notified.
    const auto snapshot = listeners_;
    for (const auto& listener : snapshot) {
        listener(event);
    }
}

}  // namespace dxg::ownership
