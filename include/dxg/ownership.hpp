#pragma once

/// @file include/dxg/ownership.hpp
/// @brief Ownership Guard: single-owner access control for admin operations.
///
/// # Module: Ownership Guard
///
/// ## Responsibility
/// Hold the one identity allowed to run privileged router operations and
/// funnel every change of that identity through a guarded setter.
///
/// ## State Machine
/// ```
///   create(X) ──► Active(owner = X) ──transfer(Y)──► Active(owner = Y)
///                       │
///                       └──renounce──► Renounced (owner = null, terminal)
/// ```
/// There is no path out of Renounced: `require_owner` fails for every caller,
/// including the null address.
///
/// ## Guarantees
/// - `require_owner` runs before any effect of a guarded operation; a failed
///   call leaves owner and listeners untouched
/// - Every owner mutation notifies all listeners with (previous, new) after
///   the mutation is applied
/// - Not thread-safe: the surrounding execution environment serialises calls

#include "dxg/types.hpp"
#include "dxg/violation.hpp"

#include <functional>
#include <variant>
#include <vector>

namespace dxg::ownership {

/// Notification emitted on every owner change.
struct OwnershipTransferred {
    Address previous_owner;  ///< Null on the initial assignment
    Address new_owner;       ///< Null on renouncement
};

/// Callback receiving ownership notifications.
using OwnershipListener = std::function<void(const OwnershipTransferred&)>;

class OwnershipGuard;

/// Result of `OwnershipGuard::create`: the guard, or why it was refused.
using GuardOrViolation = std::variant<OwnershipGuard, Violation>;

// ─── OwnershipGuard ───────────────────────────────────────────────────────────

class OwnershipGuard {
public:
    OwnershipGuard(const OwnershipGuard&)            = delete;
    OwnershipGuard& operator=(const OwnershipGuard&) = delete;
    OwnershipGuard(OwnershipGuard&&)                 = default;
    OwnershipGuard& operator=(OwnershipGuard&&)      = default;

    /// Construct a guard owned by `initial_owner`.
    ///
    /// # Returns
    /// - `InvalidAddress(initial_owner)` if `initial_owner` is null
    /// - the guard otherwise; `listener`, when set, is subscribed and receives
    ///   the initial `(null, initial_owner)` notification
    [[nodiscard]] static GuardOrViolation create(const Address& initial_owner,
                                                 OwnershipListener listener = {});

    /// Current owner. Null once renounced.
    [[nodiscard]] const Address& owner() const noexcept { return owner_; }

    /// True once ownership has been renounced.
    [[nodiscard]] bool is_renounced() const noexcept { return owner_.is_zero(); }

    /// Gate for every privileged operation.
    /// Fails with `Unauthorized(caller)` unless `caller` is the live owner.
    [[nodiscard]] Status require_owner(const Address& caller) const noexcept;

    /// Hand ownership to `new_owner`.
    ///
    /// # Failure
    /// - `Unauthorized(caller)` if `caller` is not the owner (checked first)
    /// - `InvalidAddress(new_owner)` if `new_owner` is null
    [[nodiscard]] Status transfer_ownership(const Address& caller,
                                            const Address& new_owner);

    /// Give up ownership for good. Fails with `Unauthorized(caller)`.
    [[nodiscard]] Status renounce_ownership(const Address& caller);

    /// Register another listener for later owner changes.
    void subscribe(OwnershipListener listener);

private:
    OwnershipGuard() = default;

    /// The single writer of `owner_`.
    void set_owner(const Address& new_owner);

    Address                        owner_{};
    std::vector<OwnershipListener> listeners_;
};

}  // namespace dxg::ownership
