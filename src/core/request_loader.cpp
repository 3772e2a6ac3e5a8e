/// @file src/core/request_loader.cpp
/// @brief CSV RequestLoader for router requests.

#include "dxg/request_loader.hpp"

#include <charconv>
#include <fstream>
#include <new>
#include <sstream>
#include <utility>

namespace dxg::core {

using router::AddLiquidityRequest;
using router::MultiSwapRequest;
using router::RemoveLiquidityRequest;
using router::RouterRequest;
using router::SwapExactInRequest;
using router::SwapExactOutRequest;

namespace {

/// Strip spaces, tabs and line terminators from both ends.
std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/// Split on `sep`, trimming each field. Empty fields are kept.
std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> out;
    std::size_t start = 0;
    while (true) {
        const auto pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            out.push_back(trim(s.substr(start)));
            break;
        }
        out.push_back(trim(s.substr(start, pos - start)));
        start = pos + 1;
    }
    return out;
}

std::optional<Address> parse_address(std::string_view token) noexcept {
    return Address::from_hex(trim(token));
}

/// `a;b;c` → amounts. An empty field means an empty list.
std::optional<std::vector<Amount>> parse_amount_list(std::string_view token) {
    std::vector<Amount> out;
    if (trim(token).empty()) {
        return out;
    }
    for (const auto item : split(token, ';')) {
        auto value = RequestLoader::parse_uint(item);
        if (!value) {
            return std::nullopt;
        }
        out.push_back(*value);
    }
    return out;
}

/// `p1;p2` where each p is `0xA>0xB`. An empty field means no paths.
std::optional<std::vector<Path>> parse_path_list(std::string_view token) {
    std::vector<Path> out;
    if (trim(token).empty()) {
        return out;
    }
    for (const auto item : split(token, ';')) {
        auto path = RequestLoader::parse_path(item);
        if (!path) {
            return std::nullopt;
        }
        out.push_back(std::move(*path));
    }
    return out;
}

std::optional<RouterRequest>
parse_add_liquidity(const std::vector<std::string_view>& f) {
    if (f.size() != 9) return std::nullopt;
    const auto token_a   = parse_address(f[1]);
    const auto token_b   = parse_address(f[2]);
    const auto desired_a = RequestLoader::parse_uint(f[3]);
    const auto desired_b = RequestLoader::parse_uint(f[4]);
    const auto min_a     = RequestLoader::parse_uint(f[5]);
    const auto min_b     = RequestLoader::parse_uint(f[6]);
    const auto to        = parse_address(f[7]);
    const auto deadline  = RequestLoader::parse_uint(f[8]);
    if (!token_a || !token_b || !desired_a || !desired_b ||
        !min_a || !min_b || !to || !deadline) {
        return std::nullopt;
    }
    return AddLiquidityRequest{
        .token_a          = *token_a,
        .token_b          = *token_b,
        .amount_a_desired = *desired_a,
        .amount_b_desired = *desired_b,
        .amount_a_min     = *min_a,
        .amount_b_min     = *min_b,
        .to               = *to,
        .deadline         = *deadline,
    };
}

std::optional<RouterRequest>
parse_remove_liquidity(const std::vector<std::string_view>& f) {
    if (f.size() != 8) return std::nullopt;
    const auto token_a   = parse_address(f[1]);
    const auto token_b   = parse_address(f[2]);
    const auto liquidity = RequestLoader::parse_uint(f[3]);
    const auto min_a     = RequestLoader::parse_uint(f[4]);
    const auto min_b     = RequestLoader::parse_uint(f[5]);
    const auto to        = parse_address(f[6]);
    const auto deadline  = RequestLoader::parse_uint(f[7]);
    if (!token_a || !token_b || !liquidity || !min_a || !min_b || !to || !deadline) {
        return std::nullopt;
    }
    return RemoveLiquidityRequest{
        .token_a      = *token_a,
        .token_b      = *token_b,
        .liquidity    = *liquidity,
        .amount_a_min = *min_a,
        .amount_b_min = *min_b,
        .to           = *to,
        .deadline     = *deadline,
    };
}

std::optional<RouterRequest>
parse_swap_exact_in(const std::vector<std::string_view>& f) {
    if (f.size() != 6) return std::nullopt;
    const auto amount_in      = RequestLoader::parse_uint(f[1]);
    const auto amount_out_min = RequestLoader::parse_uint(f[2]);
    auto       path           = RequestLoader::parse_path(f[3]);
    const auto to             = parse_address(f[4]);
    const auto deadline       = RequestLoader::parse_uint(f[5]);
    if (!amount_in || !amount_out_min || !path || !to || !deadline) {
        return std::nullopt;
    }
    return SwapExactInRequest{
        .amount_in      = *amount_in,
        .amount_out_min = *amount_out_min,
        .path           = std::move(*path),
        .to             = *to,
        .deadline       = *deadline,
    };
}

std::optional<RouterRequest>
parse_swap_exact_out(const std::vector<std::string_view>& f) {
    if (f.size() != 6) return std::nullopt;
    const auto amount_out    = RequestLoader::parse_uint(f[1]);
    const auto amount_in_max = RequestLoader::parse_uint(f[2]);
    auto       path          = RequestLoader::parse_path(f[3]);
    const auto to            = parse_address(f[4]);
    const auto deadline      = RequestLoader::parse_uint(f[5]);
    if (!amount_out || !amount_in_max || !path || !to || !deadline) {
        return std::nullopt;
    }
    return SwapExactOutRequest{
        .amount_out    = *amount_out,
        .amount_in_max = *amount_in_max,
        .path          = std::move(*path),
        .to            = *to,
        .deadline      = *deadline,
    };
}

std::optional<RouterRequest>
parse_multi_swap(const std::vector<std::string_view>& f) {
    if (f.size() != 6) return std::nullopt;
    auto       amounts_in      = parse_amount_list(f[1]);
    auto       amounts_out_min = parse_amount_list(f[2]);
    auto       paths           = parse_path_list(f[3]);
    const auto to              = parse_address(f[4]);
    const auto deadline        = RequestLoader::parse_uint(f[5]);
    if (!amounts_in || !amounts_out_min || !paths || !to || !deadline) {
        return std::nullopt;
    }
    return MultiSwapRequest{
        .amounts_in      = std::move(*amounts_in),
        .amounts_out_min = std::move(*amounts_out_min),
        .paths           = std::move(*paths),
        .to              = *to,
        .deadline        = *deadline,
    };
}

}  // anonymous namespace

// ─── RequestLoader::parse_uint ────────────────────────────────────────────────

std::optional<std::uint64_t>
RequestLoader::parse_uint(std::string_view token) noexcept {
    token = trim(token);
    if (token.empty()) {
        return std::nullopt;
    }

    std::uint64_t value = 0;
    const char* first = token.data();
    const char* last  = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;  // overflow, sign or trailing garbage
    }
    return value;
}

// ─── RequestLoader::parse_path ────────────────────────────────────────────────

std::optional<Path> RequestLoader::parse_path(std::string_view token) noexcept {
    try {
        Path path;
        for (const auto hop : split(token, '>')) {
            auto addr = parse_address(hop);
            if (!addr) {
                return std::nullopt;
            }
            path.push_back(*addr);
        }
        return path;
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

// ─── RequestLoader::parse_row ─────────────────────────────────────────────────

std::optional<RouterRequest>
RequestLoader::parse_row(std::string_view line) noexcept {
    line = trim(line);
    // Skip blank lines and comment lines.
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }

    try {
        const auto fields = split(line, ',');
        const auto op = fields[0];

        if (op == "add_liquidity")    return parse_add_liquidity(fields);
        if (op == "remove_liquidity") return parse_remove_liquidity(fields);
        if (op == "swap_exact_in")    return parse_swap_exact_in(fields);
        if (op == "swap_exact_out")   return parse_swap_exact_out(fields);
        if (op == "multi_swap")       return parse_multi_swap(fields);
        return std::nullopt;
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

// ─── RequestLoader::parse_csv_string ──────────────────────────────────────────

std::vector<RouterRequest>
RequestLoader::parse_csv_string(const std::string& csv_content) noexcept {
    std::vector<RouterRequest> requests;
    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;

    while (std::getline(stream, line)) {
        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!header_skipped) {
            // First non-empty, non-comment line is the header.
            if (!line.empty() && line[0] != '#') {
                header_skipped = true;
            }
            continue;
        }

        auto request = parse_row(line);
        if (request) {
            requests.push_back(std::move(*request));
        }
    }

    return requests;
}

// ─── RequestLoader::load_csv ──────────────────────────────────────────────────

std::optional<std::vector<RouterRequest>>
RequestLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

}  // namespace dxg::core
