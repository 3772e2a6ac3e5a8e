#pragma once

#include "dxg/types.hpp"

#include <cstddef>
#include <limits>

/// @file include/dxg/constants.hpp
/// @brief Policy constants for the DXG system.

namespace dxg::constants {

// ─── Type Bounds ──────────────────────────────────────────────────────────────

/// Largest representable token amount.
static constexpr Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();

/// Largest representable timestamp.
static constexpr Timestamp MAX_TIMESTAMP = std::numeric_limits<Timestamp>::max();

// ─── Liquidity ────────────────────────────────────────────────────────────────

/// Minimum viable liquidity floor, applied to each side of a deposit.
static constexpr Amount MINIMUM_LIQUIDITY = 1000;

// ─── Paths ────────────────────────────────────────────────────────────────────

/// A swap path needs at least an input and an output token.
static constexpr std::size_t MIN_PATH_LENGTH = 2;

/// Default upper bound on path length.
static constexpr std::size_t DEFAULT_MAX_PATH_LENGTH = 4;

// ─── Deadlines ────────────────────────────────────────────────────────────────

/// Default maximum distance of a deadline into the future (one hour).
static constexpr Timestamp DEFAULT_MAX_DEADLINE_EXTENSION = 3600;

// ─── Batches ──────────────────────────────────────────────────────────────────

/// Default upper bound on the number of legs in a multi-swap.
static constexpr std::size_t DEFAULT_MAX_BATCH_SIZE = 16;

} // namespace dxg::constants
