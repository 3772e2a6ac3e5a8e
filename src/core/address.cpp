/// @file src/core/address.cpp
/// @brief Address hex parsing and rendering.

#include "dxg/types.hpp"

#include <fmt/format.h>

namespace dxg {

namespace {

/// Value of one hex digit, or -1.
int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // anonymous namespace

// ─── Address::from_hex ────────────────────────────────────────────────────────

std::optional<Address> Address::from_hex(std::string_view text) noexcept {
    if (text.size() != 2 + 2 * ADDRESS_SIZE) {
        return std::nullopt;
    }
    if (text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) {
        return std::nullopt;
    }

    Address out{};
    for (std::size_t i = 0; i < ADDRESS_SIZE; ++i) {
        const int hi = hex_value(text[2 + 2 * i]);
        const int lo = hex_value(text[3 + 2 * i]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return out;
}

// ─── Address::to_hex ──────────────────────────────────────────────────────────

std::string Address::to_hex() const {
    std::string out = "0x";
    out.reserve(2 + 2 * ADDRESS_SIZE);
    for (const auto b : bytes) {
        out += fmt::format("{:02x}", b);
    }
    return out;
}

}  // namespace dxg
