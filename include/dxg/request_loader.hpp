#pragma once

/// @file include/dxg/request_loader.hpp
/// @brief CSV loader for router requests.
///
/// # Module: RequestLoader
///
/// ## Responsibility
/// Parse CSV files of router requests into `std::vector<RouterRequest>`.
/// Malformed rows are skipped; the loader never crashes on bad input.
///
/// ## Expected CSV Format
/// ```
/// op,args
/// add_liquidity,tokenA,tokenB,amountADesired,amountBDesired,amountAMin,amountBMin,to,deadline
/// remove_liquidity,tokenA,tokenB,liquidity,amountAMin,amountBMin,to,deadline
/// swap_exact_in,amountIn,amountOutMin,path,to,deadline
/// swap_exact_out,amountOut,amountInMax,path,to,deadline
/// multi_swap,amountsIn,amountsOutMin,paths,to,deadline
/// ```
/// The first non-comment line is treated as a header and skipped. A `path`
/// joins addresses with `>`; list fields join elements with `;`, so
/// `paths` looks like `0xA>0xB;0xC>0xD`.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only when the file cannot be opened
/// - Skips individual bad rows rather than failing the entire load
/// - Parsing does not validate: a null address or zero amount parses fine
///   and is left for the RouterGuard to reject

#include "dxg/router_guard.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dxg::core {

class RequestLoader {
public:
    /// Load requests from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty vector if the file has a header but no valid rows
    /// - Parsed requests, skipping malformed rows
    [[nodiscard]] static std::optional<std::vector<router::RouterRequest>>
    load_csv(const std::string& filepath) noexcept;

    /// Parse requests from a CSV-formatted string (header first).
    [[nodiscard]] static std::vector<router::RouterRequest>
    parse_csv_string(const std::string& csv_content) noexcept;

    /// Parse one data row. `nullopt` for blank, comment or malformed rows.
    [[nodiscard]] static std::optional<router::RouterRequest>
    parse_row(std::string_view line) noexcept;

    /// Parse a decimal unsigned integer with no sign, spaces or trailing
    /// characters. `nullopt` on overflow.
    [[nodiscard]] static std::optional<std::uint64_t>
    parse_uint(std::string_view token) noexcept;

    /// Parse `0xA>0xB>...`. `nullopt` if any hop is not an address.
    [[nodiscard]] static std::optional<Path>
    parse_path(std::string_view token) noexcept;
};

}  // namespace dxg::core
