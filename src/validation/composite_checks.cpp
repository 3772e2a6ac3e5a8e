/// @file src/validation/composite_checks.cpp
/// @brief Slippage policy and the composite checks built from the basic ones.
///
/// Composites short-circuit: the first failing sub-check is returned as-is.

#include "dxg/validation.hpp"

namespace dxg::validation {

// ─── slippage_consistent ──────────────────────────────────────────────────────

Status slippage_consistent(Amount desired_a,
                           Amount desired_b,
                           Amount min_a,
                           Amount min_b) noexcept {
    if (min_a > desired_a || min_b > desired_b) {
        return InsufficientLiquidityAmounts{desired_a, desired_b, min_a, min_b};
    }

    // 100% slippage guard, one side at a time.
    if (desired_a > 0 && min_a == 0) {
        return InvalidSlippage{0, 1};
    }
    if (desired_b > 0 && min_b == 0) {
        return InvalidSlippage{0, 1};
    }
    return std::nullopt;
}

// ─── liquidity_amounts_valid ──────────────────────────────────────────────────

Status liquidity_amounts_valid(Amount desired_a,
                               Amount desired_b,
                               Amount min_a,
                               Amount min_b,
                               Amount minimum_liquidity) noexcept {
    if (auto v = amount_positive(desired_a)) return v;
    if (auto v = amount_positive(desired_b)) return v;
    if (auto v = slippage_consistent(desired_a, desired_b, min_a, min_b)) return v;
    if (auto v = amount_at_least(desired_a, minimum_liquidity)) return v;
    if (auto v = amount_at_least(desired_b, minimum_liquidity)) return v;
    return std::nullopt;
}

// ─── swap_amounts_valid ───────────────────────────────────────────────────────

Status swap_amounts_valid(Amount amount_in,
                          Amount /*amount_out_min*/,
                          std::span<const Address> path,
                          std::size_t max_path_length) noexcept {
    if (auto v = amount_positive(amount_in)) return v;
    return path_well_formed(path, max_path_length);
}

// ─── token_pair_valid ─────────────────────────────────────────────────────────

Status token_pair_valid(const Address& token_a, const Address& token_b) noexcept {
    if (auto v = identity_exists(token_a)) return v;
    if (auto v = identity_exists(token_b)) return v;
    if (token_a == token_b) {
        return InvalidAddress{token_b};
    }
    return std::nullopt;
}

// ─── recipient_valid ──────────────────────────────────────────────────────────

Status recipient_valid(const Address& recipient,
                       const Address& factory,
                       const Address& router) noexcept {
    if (auto v = identity_exists(recipient)) return v;
    if (auto v = identity_not_protected(recipient, factory)) return v;
    return identity_not_protected(recipient, router);
}

}  // namespace dxg::validation
