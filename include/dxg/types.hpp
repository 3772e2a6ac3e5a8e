#pragma once

/// @file include/dxg/types.hpp
/// @brief Shared primitive types for the DEX Guard (DXG) system.
///
/// Every module includes this file. It defines the value types that the
/// router hands to the guard: account identities, token amounts, ambient
/// timestamps and swap paths.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dxg {

/// Width of an account identity in bytes.
inline constexpr std::size_t ADDRESS_SIZE = 20;

// ─── Scalar Types ─────────────────────────────────────────────────────────────

/// Unsigned token amount. The representable maximum is
/// `constants::MAX_AMOUNT`.
using Amount = std::uint64_t;

/// Ambient (block) time in seconds.
using Timestamp = std::uint64_t;

// ─── Address ──────────────────────────────────────────────────────────────────

/// A 20-byte account identity.
///
/// The all-zero value is the null sentinel: it names no account and never
/// passes an "must exist" check.
struct Address {
    std::array<std::uint8_t, ADDRESS_SIZE> bytes{};

    /// The null sentinel.
    [[nodiscard]] static constexpr Address zero() noexcept { return Address{}; }

    /// Build an address whose last byte is `tag` (the rest zero).
    /// Handy for fixtures: `Address::from_tag(0xA1)`.
    [[nodiscard]] static constexpr Address from_tag(std::uint8_t tag) noexcept {
        Address a{};
        a.bytes[ADDRESS_SIZE - 1] = tag;
        return a;
    }

    /// Parse `0x`-prefixed, 40-digit hex. Case-insensitive.
    ///
    /// # Returns
    /// `nullopt` if the prefix is missing, the length is wrong, or any digit
    /// is not hexadecimal.
    [[nodiscard]] static std::optional<Address> from_hex(std::string_view text) noexcept;

    /// Lower-case `0x`-prefixed hex rendering.
    [[nodiscard]] std::string to_hex() const;

    /// True iff this is the null sentinel.
    [[nodiscard]] constexpr bool is_zero() const noexcept {
        for (const auto b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    friend constexpr bool operator==(const Address&, const Address&) noexcept = default;
};

/// Ordered token route for a swap: path[0] is sold, path.back() is bought.
using Path = std::vector<Address>;

} // namespace dxg
