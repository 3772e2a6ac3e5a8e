#pragma once

/// @file include/dxg/violation.hpp
/// @brief Typed validation failures: the DXG error taxonomy.
///
/// # Module: Violation
///
/// ## Responsibility
/// Describe exactly one violated rule with the diagnostic fields a caller
/// needs to tell which argument failed and against which bound.
///
/// ## Contract
/// Every check in the system returns `Status`:
///   - `std::nullopt`      → the input is admitted, nothing else happened
///   - a `Violation` value → the first violated rule; the caller must not
///                           proceed and no state has changed
///
/// Field names and ordering mirror the router's revert payloads so that
/// diagnostics line up one-to-one.

#include "dxg/types.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace dxg {

// ─── Failure Kinds ────────────────────────────────────────────────────────────

/// Identity failed a null or protected-address check.
struct InvalidAddress {
    Address address;

    bool operator==(const InvalidAddress&) const = default;
};

/// Numeric value outside its required bound [min, max].
struct InvalidAmount {
    Amount got;
    Amount min;
    Amount max;

    bool operator==(const InvalidAmount&) const = default;
};

/// Zero-length sequence where at least one element is required.
struct EmptyArray {
    bool operator==(const EmptyArray&) const = default;
};

/// Path length outside [min_length, max_length].
struct InvalidPath {
    std::size_t length;
    std::size_t min_length;
    std::size_t max_length;

    bool operator==(const InvalidPath&) const = default;
};

/// The same address appears at positions i < j of a path.
struct DuplicateAddressInPath {
    Address     address;
    std::size_t i;
    std::size_t j;

    bool operator==(const DuplicateAddressInPath&) const = default;
};

/// Deadline already passed, or too far in the future.
struct DeadlineExpired {
    Timestamp deadline;
    Timestamp now;

    bool operator==(const DeadlineExpired&) const = default;
};

/// A slippage minimum exceeds its desired amount.
struct InsufficientLiquidityAmounts {
    Amount amount_a;
    Amount amount_b;
    Amount min_a;
    Amount min_b;

    bool operator==(const InsufficientLiquidityAmounts&) const = default;
};

/// Zero minimum against a nonzero desired amount.
struct InvalidSlippage {
    Amount got;
    Amount min;

    bool operator==(const InvalidSlippage&) const = default;
};

/// Two parallel sequences have different lengths.
struct ArrayLengthMismatch {
    std::size_t len1;
    std::size_t len2;

    bool operator==(const ArrayLengthMismatch&) const = default;
};

/// Privileged call from an account that is not the current owner.
struct Unauthorized {
    Address caller;

    bool operator==(const Unauthorized&) const = default;
};

// ─── Violation / Status ───────────────────────────────────────────────────────

/// Exactly one violated rule.
using Violation = std::variant<
    InvalidAddress,
    InvalidAmount,
    EmptyArray,
    InvalidPath,
    DuplicateAddressInPath,
    DeadlineExpired,
    InsufficientLiquidityAmounts,
    InvalidSlippage,
    ArrayLengthMismatch,
    Unauthorized>;

/// Outcome of a check: `nullopt` on success, the violation otherwise.
using Status = std::optional<Violation>;

/// Stable name of the failure kind, e.g. "DuplicateAddressInPath".
[[nodiscard]] std::string_view kind_name(const Violation& violation) noexcept;

/// Name plus diagnostic fields, e.g. "InvalidSlippage(got=0, min=1)".
[[nodiscard]] std::string to_string(const Violation& violation);

// ─── Exception Bridge ─────────────────────────────────────────────────────────

/// Thrown by `enforce` for callers that abort by exception.
class ValidationFailure : public std::runtime_error {
public:
    explicit ValidationFailure(Violation violation);

    [[nodiscard]] const Violation& violation() const noexcept { return violation_; }

private:
    Violation violation_;
};

/// Throw `ValidationFailure` if `status` holds a violation; otherwise return.
void enforce(const Status& status);

} // namespace dxg
