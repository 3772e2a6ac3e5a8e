/// @file src/core/violation.cpp
/// @brief Violation naming, formatting and the exception bridge.

#include "dxg/violation.hpp"

#include <fmt/format.h>

#include <type_traits>
#include <utility>

namespace dxg {

namespace {

template <typename>
inline constexpr bool unhandled_kind = false;

}  // anonymous namespace

// ─── kind_name ────────────────────────────────────────────────────────────────

std::string_view kind_name(const Violation& violation) noexcept {
    return std::visit([](const auto& v) -> std::string_view {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, InvalidAddress>)               return "InvalidAddress";
        else if constexpr (std::is_same_v<T, InvalidAmount>)           return "InvalidAmount";
        else if constexpr (std::is_same_v<T, EmptyArray>)              return "EmptyArray";
        else if constexpr (std::is_same_v<T, InvalidPath>)             return "InvalidPath";
        else if constexpr (std::is_same_v<T, DuplicateAddressInPath>)  return "DuplicateAddressInPath";
        else if constexpr (std::is_same_v<T, DeadlineExpired>)         return "DeadlineExpired";
        else if constexpr (std::is_same_v<T, InsufficientLiquidityAmounts>)
                                                                       return "InsufficientLiquidityAmounts";
        else if constexpr (std::is_same_v<T, InvalidSlippage>)         return "InvalidSlippage";
        else if constexpr (std::is_same_v<T, ArrayLengthMismatch>)     return "ArrayLengthMismatch";
        else if constexpr (std::is_same_v<T, Unauthorized>)            return "Unauthorized";
        else static_assert(unhandled_kind<T>, "kind_name: unhandled Violation alternative");
    }, violation);
}

// ─── to_string ────────────────────────────────────────────────────────────────

std::string to_string(const Violation& violation) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, InvalidAddress>) {
            return fmt::format("InvalidAddress(address={})", v.address.to_hex());
        } else if constexpr (std::is_same_v<T, InvalidAmount>) {
            return fmt::format("InvalidAmount(got={}, min={}, max={})", v.got, v.min, v.max);
        } else if constexpr (std::is_same_v<T, EmptyArray>) {
            return "EmptyArray()";
        } else if constexpr (std::is_same_v<T, InvalidPath>) {
            return fmt::format("InvalidPath(length={}, min_length={}, max_length={})",
                               v.length, v.min_length, v.max_length);
        } else if constexpr (std::is_same_v<T, DuplicateAddressInPath>) {
            return fmt::format("DuplicateAddressInPath(address={}, i={}, j={})",
                               v.address.to_hex(), v.i, v.j);
        } else if constexpr (std::is_same_v<T, DeadlineExpired>) {
            return fmt::format("DeadlineExpired(deadline={}, now={})", v.deadline, v.now);
        } else if constexpr (std::is_same_v<T, InsufficientLiquidityAmounts>) {
            return fmt::format(
                "InsufficientLiquidityAmounts(amount_a={}, amount_b={}, min_a={}, min_b={})",
                v.amount_a, v.amount_b, v.min_a, v.min_b);
        } else if constexpr (std::is_same_v<T, InvalidSlippage>) {
            return fmt::format("InvalidSlippage(got={}, min={})", v.got, v.min);
        } else if constexpr (std::is_same_v<T, ArrayLengthMismatch>) {
            return fmt::format("ArrayLengthMismatch(len1={}, len2={})", v.len1, v.len2);
        } else if constexpr (std::is_same_v<T, Unauthorized>) {
            return fmt::format("Unauthorized(caller={})", v.caller.to_hex());
        } else {
            static_assert(unhandled_kind<T>, "to_string: unhandled Violation alternative");
        }
    }, violation);
}

// ─── ValidationFailure ────────────────────────────────────────────────────────

ValidationFailure::ValidationFailure(Violation violation)
    : std::runtime_error(to_string(violation))
    , violation_(std::move(violation))
{}

void enforce(const Status& status) {
    if (status) {
        throw ValidationFailure(*status);
    }
}

}  // namespace dxg
