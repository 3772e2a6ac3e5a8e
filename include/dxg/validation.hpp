#pragma once

/// @file include/dxg/validation.hpp
/// @brief Validation Engine: stateless precondition checks for router input.
///
/// # Module: Validation Engine
///
/// ## Responsibility
/// Decide whether caller-supplied router input (addresses, amounts, token
/// paths, deadlines, slippage bounds) is admissible before any state-mutating
/// logic runs. Each check either admits silently or reports exactly one
/// typed `Violation` describing the first rule broken.
///
/// ## Usage
/// ```cpp
/// using namespace dxg::validation;
/// if (auto v = deadline_valid(req.deadline, clock.now(), max_ext)) {
///     return v;                       // abort, nothing mutated
/// }
/// if (auto v = swap_amounts_valid(req.amount_in, req.amount_out_min,
///                                 req.path, max_path)) {
///     return v;
/// }
/// ```
///
/// ## Guarantees
/// - Zero panics: every check is `noexcept` and returns `Status`
/// - Pure: the result depends only on the arguments (ambient time is passed
///   in explicitly), so re-running a check gives the same outcome
/// - Composite checks evaluate sub-checks in a fixed order and stop at the
///   first failure

#include "dxg/constants.hpp"
#include "dxg/types.hpp"
#include "dxg/violation.hpp"

#include <cstddef>
#include <ranges>
#include <span>

namespace dxg::validation {

// ─── Identity ─────────────────────────────────────────────────────────────────

/// `identity` must not be the null sentinel.
/// Fails with `InvalidAddress(identity)`.
[[nodiscard]] Status identity_exists(const Address& identity) noexcept;

/// `identity` must differ from `protected_address` (factory, router, ...).
/// Fails with `InvalidAddress(identity)`.
[[nodiscard]] Status identity_not_protected(const Address& identity,
                                            const Address& protected_address) noexcept;

// ─── Amounts ──────────────────────────────────────────────────────────────────

/// `amount > 0`. Fails with `InvalidAmount(amount, 1, MAX_AMOUNT)`.
[[nodiscard]] Status amount_positive(Amount amount) noexcept;

/// `1 <= amount <= max`. Fails with `InvalidAmount(amount, 1, max)`.
[[nodiscard]] Status amount_bounded(Amount amount, Amount max) noexcept;

/// `amount >= min`. Fails with `InvalidAmount(amount, min, MAX_AMOUNT)`.
[[nodiscard]] Status amount_at_least(Amount amount, Amount min) noexcept;

// ─── Sequences ────────────────────────────────────────────────────────────────

/// `1 <= length <= max`.
///
/// # Failure
/// - `EmptyArray` when `length == 0`
/// - `InvalidAmount(length, 1, max)` when `length > max`
[[nodiscard]] Status sequence_length_bounded(std::size_t length,
                                             std::size_t max) noexcept;

/// Two parallel sequences must have equal length.
/// Fails with `ArrayLengthMismatch(len1, len2)`.
[[nodiscard]] Status arrays_length_match(std::size_t len1,
                                         std::size_t len2) noexcept;

/// Range form of `arrays_length_match`.
template <std::ranges::sized_range First, std::ranges::sized_range Second>
[[nodiscard]] Status arrays_length_match(const First& first,
                                         const Second& second) noexcept {
    return arrays_length_match(static_cast<std::size_t>(std::ranges::size(first)),
                               static_cast<std::size_t>(std::ranges::size(second)));
}

/// A swap path must:
///   1. have `MIN_PATH_LENGTH <= size <= max_length`
///      → otherwise `InvalidPath(size, MIN_PATH_LENGTH, max_length)`
///   2. contain no null address, checked front to back
///      → otherwise `InvalidAddress(element)`
///   3. contain no address twice anywhere
///      → otherwise `DuplicateAddressInPath(address, i, j)` for the lowest
///        `i`, then lowest `j > i`
///
/// The duplicate scan is all-pairs. `max_length` bounds the work.
[[nodiscard]] Status path_well_formed(std::span<const Address> path,
                                      std::size_t max_length) noexcept;

// ─── Time ─────────────────────────────────────────────────────────────────────

/// `now <= deadline <= now + max_extension`.
///
/// Both bounds fail with `DeadlineExpired(deadline, now)`. The upper bound
/// saturates at `MAX_TIMESTAMP` rather than wrapping.
[[nodiscard]] Status deadline_valid(Timestamp deadline,
                                    Timestamp now,
                                    Timestamp max_extension) noexcept;

// ─── Slippage ─────────────────────────────────────────────────────────────────

/// Slippage bounds of a two-sided operation.
///
/// Order:
///   1. `min_a <= desired_a` and `min_b <= desired_b`
///      → `InsufficientLiquidityAmounts(desired_a, desired_b, min_a, min_b)`
///   2. side A: `desired_a > 0` requires `min_a > 0` → `InvalidSlippage(0, 1)`
///   3. side B: same rule → `InvalidSlippage(0, 1)`
///
/// A zero minimum against a nonzero desired amount is a configuration error,
/// not an "accept any price" order.
[[nodiscard]] Status slippage_consistent(Amount desired_a,
                                         Amount desired_b,
                                         Amount min_a,
                                         Amount min_b) noexcept;

// ─── Composites ───────────────────────────────────────────────────────────────

/// Deposit amounts for adding liquidity.
///
/// Sub-checks, first failure wins:
///   `amount_positive(desired_a)`, `amount_positive(desired_b)`,
///   `slippage_consistent(...)`, `amount_at_least(desired_a, floor)`,
///   `amount_at_least(desired_b, floor)`.
[[nodiscard]] Status liquidity_amounts_valid(
    Amount desired_a,
    Amount desired_b,
    Amount min_a,
    Amount min_b,
    Amount minimum_liquidity = constants::MINIMUM_LIQUIDITY) noexcept;

/// Swap amounts: `amount_positive(amount_in)` then
/// `path_well_formed(path, max_path_length)`.
///
/// `amount_out_min` is not bounded below: zero means "accept any output".
[[nodiscard]] Status swap_amounts_valid(
    Amount amount_in,
    Amount amount_out_min,
    std::span<const Address> path,
    std::size_t max_path_length = constants::DEFAULT_MAX_PATH_LENGTH) noexcept;

/// Both tokens exist and differ.
///
/// # Failure
/// `InvalidAddress(token_a)` or `InvalidAddress(token_b)` for a null token;
/// `InvalidAddress(token_b)` when both are the same.
[[nodiscard]] Status token_pair_valid(const Address& token_a,
                                      const Address& token_b) noexcept;

/// Recipient exists and is neither the factory nor the router.
/// Fails with `InvalidAddress(recipient)`.
[[nodiscard]] Status recipient_valid(const Address& recipient,
                                     const Address& factory,
                                     const Address& router) noexcept;

}  // namespace dxg::validation
