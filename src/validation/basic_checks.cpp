/// @file src/validation/basic_checks.cpp
/// @brief Identity, amount, sequence and deadline checks.

#include "dxg/validation.hpp"

namespace dxg::validation {

using constants::MAX_AMOUNT;
using constants::MAX_TIMESTAMP;

// ─── identity_exists ──────────────────────────────────────────────────────────

Status identity_exists(const Address& identity) noexcept {
    if (identity.is_zero()) {
        return InvalidAddress{identity};
    }
    return std::nullopt;
}

// ─── identity_not_protected ───────────────────────────────────────────────────

Status identity_not_protected(const Address& identity,
                              const Address& protected_address) noexcept {
    if (identity == protected_address) {
        return InvalidAddress{identity};
    }
    return std::nullopt;
}

// ─── amount_positive ──────────────────────────────────────────────────────────

Status amount_positive(Amount amount) noexcept {
    if (amount == 0) {
        return InvalidAmount{amount, 1, MAX_AMOUNT};
    }
    return std::nullopt;
}

// ─── amount_bounded ───────────────────────────────────────────────────────────

Status amount_bounded(Amount amount, Amount max) noexcept {
    if (amount == 0 || amount > max) {
        return InvalidAmount{amount, 1, max};
    }
    return std::nullopt;
}

// ─── amount_at_least ──────────────────────────────────────────────────────────

Status amount_at_least(Amount amount, Amount min) noexcept {
    if (amount < min) {
        return InvalidAmount{amount, min, MAX_AMOUNT};
    }
    return std::nullopt;
}

// ─── sequence_length_bounded ──────────────────────────────────────────────────

Status sequence_length_bounded(std::size_t length, std::size_t max) noexcept {
    if (length == 0) {
        return EmptyArray{};
    }
    if (length > max) {
        return InvalidAmount{static_cast<Amount>(length), 1, static_cast<Amount>(max)};
    }
    return std::nullopt;
}

// ─── arrays_length_match ──────────────────────────────────────────────────────

Status arrays_length_match(std::size_t len1, std::size_t len2) noexcept {
    if (len1 != len2) {
        return ArrayLengthMismatch{len1, len2};
    }
    return std::nullopt;
}

// ─── deadline_valid ───────────────────────────────────────────────────────────

Status deadline_valid(Timestamp deadline,
                      Timestamp now,
                      Timestamp max_extension) noexcept {
    if (deadline < now) {
        return DeadlineExpired{deadline, now};
    }

    // Saturate: now + max_extension must not wrap past MAX_TIMESTAMP.
    const Timestamp latest = (max_extension > MAX_TIMESTAMP - now)
                                 ? MAX_TIMESTAMP
                                 : now + max_extension;
    if (deadline > latest) {
        return DeadlineExpired{deadline, now};
    }
    return std::nullopt;
}

}  // namespace dxg::validation
