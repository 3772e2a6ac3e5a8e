/// @file src/main.cpp
/// @brief DXG CLI entry point.
///
/// Usage:
///   dxguard --check <csv_file> [options]   Admit every request in a file
///   dxguard --stream [options]             Admit CSV rows read from stdin
///   dxguard --help                         Print usage
///
/// Exit codes: 0 all admitted, 2 at least one rejected, 1 usage or I/O error.

#include "dxg/request_loader.hpp"
#include "dxg/router_guard.hpp"

#include <fmt/core.h>

#include <cstdio>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace {

using dxg::Address;
using dxg::core::RequestLoader;
using dxg::ownership::OwnershipGuard;
using dxg::router::Clock;
using dxg::router::FixedClock;
using dxg::router::RouterGuard;
using dxg::router::RouterPolicy;
using dxg::router::RouterRequest;
using dxg::router::SystemClock;

constexpr int EXIT_ADMITTED = 0;
constexpr int EXIT_ERROR    = 1;
constexpr int EXIT_REJECTED = 2;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  dxguard --check <csv_file> [options]   Admit requests from a CSV file\n"
        "  dxguard --stream [options]             Admit CSV rows from stdin\n"
        "  dxguard --help                         Show this help\n"
        "\n"
        "Options:\n"
        "  --factory <addr>        Pair factory address (required)\n"
        "  --router <addr>         Router address (required)\n"
        "  --owner <addr>          Policy owner (default: router)\n"
        "  --now <ts>              Fix ambient time (default: wall clock)\n"
        "  --max-path <n>          Longest admitted swap path (default: {})\n"
        "  --max-extension <secs>  Furthest admitted deadline (default: {})\n"
        "  --verbose               Log rejections to stderr\n"
        "\n"
        "CSV rows (header required):\n"
        "  add_liquidity,tokenA,tokenB,amountADesired,amountBDesired,amountAMin,amountBMin,to,deadline\n"
        "  remove_liquidity,tokenA,tokenB,liquidity,amountAMin,amountBMin,to,deadline\n"
        "  swap_exact_in,amountIn,amountOutMin,0xA>0xB,to,deadline\n"
        "  swap_exact_out,amountOut,amountInMax,0xA>0xB,to,deadline\n"
        "  multi_swap,in1;in2,min1;min2,0xA>0xB;0xC>0xD,to,deadline\n",
        dxg::constants::DEFAULT_MAX_PATH_LENGTH,
        dxg::constants::DEFAULT_MAX_DEADLINE_EXTENSION);
}

/// Settings collected from the command line.
struct CliOptions {
    std::string              mode;
    std::string              csv_path;
    RouterPolicy             policy{};
    std::optional<Address>   factory;
    std::optional<Address>   router;
    std::optional<Address>   owner;
    std::optional<dxg::Timestamp> now;
};

/// Parse argv into `CliOptions`. Returns nullopt after printing an error.
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    opts.mode = argv[1];

    int i = 2;
    if (opts.mode == "--check") {
        if (argc < 3) {
            fmt::print(stderr, "Error: --check requires a CSV file path\n");
            return std::nullopt;
        }
        opts.csv_path = argv[2];
        i = 3;
    }

    for (; i < argc; ++i) {
        const std::string flag(argv[i]);

        if (flag == "--verbose") {
            opts.policy.verbose = true;
            continue;
        }
        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", flag);
            return std::nullopt;
        }
        const std::string value(argv[++i]);

        if (flag == "--factory" || flag == "--router" || flag == "--owner") {
            auto addr = Address::from_hex(value);
            if (!addr) {
                fmt::print(stderr, "Error: {} is not an address: '{}'\n", flag, value);
                return std::nullopt;
            }
            if (flag == "--factory")     opts.factory = *addr;
            else if (flag == "--router") opts.router  = *addr;
            else                         opts.owner   = *addr;
        } else if (flag == "--now" || flag == "--max-path" || flag == "--max-extension") {
            auto n = RequestLoader::parse_uint(value);
            if (!n) {
                fmt::print(stderr, "Error: {} expects an unsigned integer: '{}'\n", flag, value);
                return std::nullopt;
            }
            if (flag == "--now")           opts.now = *n;
            else if (flag == "--max-path") opts.policy.max_path_length = static_cast<std::size_t>(*n);
            else                           opts.policy.max_deadline_extension = *n;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", flag);
            return std::nullopt;
        }
    }

    if (!opts.factory || !opts.router) {
        fmt::print(stderr, "Error: --factory and --router are required\n");
        return std::nullopt;
    }
    opts.policy.factory = *opts.factory;
    opts.policy.router  = *opts.router;
    return opts;
}

/// Admit one request and print its verdict. Returns true if admitted.
bool admit_and_print(const RouterGuard& guard, const RouterRequest& request,
                     std::size_t index) {
    const auto verdict = guard.admit(request);
    if (verdict) {
        fmt::print("#{:<4d} {:<16} REJECT {}\n", index,
                   dxg::router::operation_name(request), dxg::to_string(*verdict));
        return false;
    }
    fmt::print("#{:<4d} {:<16} ACCEPT\n", index, dxg::router::operation_name(request));
    return true;
}

/// Admit every request in the CSV file.
int run_check(const RouterGuard& guard, const std::string& filepath) {
    auto requests = RequestLoader::load_csv(filepath);
    if (!requests) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return EXIT_ERROR;
    }
    if (requests->empty()) {
        fmt::print(stderr, "Error: no valid requests loaded from '{}'\n", filepath);
        return EXIT_ERROR;
    }

    std::size_t rejected = 0;
    for (std::size_t k = 0; k < requests->size(); ++k) {
        if (!admit_and_print(guard, (*requests)[k], k + 1)) {
            ++rejected;
        }
    }

    fmt::print("{} requests, {} admitted, {} rejected\n",
               requests->size(), requests->size() - rejected, rejected);
    return rejected == 0 ? EXIT_ADMITTED : EXIT_REJECTED;
}

/// Admit CSV rows read from stdin. The first line is the header.
int run_stream(const RouterGuard& guard) {
    std::string line;
    bool header_skipped = false;
    std::size_t count = 0;
    std::size_t rejected = 0;

    while (std::getline(std::cin, line)) {
        // Trim carriage return for Windows-style line endings.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!header_skipped) {
            if (!line.empty() && line[0] != '#') {
                header_skipped = true;
            }
            continue;
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto request = RequestLoader::parse_row(line);
        if (!request) {
            fmt::print(stderr, "Skipping malformed row: {}\n", line);
            continue;
        }

        ++count;
        if (!admit_and_print(guard, *request, count)) {
            ++rejected;
        }
    }

    fmt::print("{} requests, {} admitted, {} rejected\n", count, count - rejected, rejected);
    return rejected == 0 ? EXIT_ADMITTED : EXIT_REJECTED;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return EXIT_ERROR;
    }

    const std::string mode(argv[1]);
    if (mode == "--help" || mode == "-h") {
        print_usage();
        return EXIT_ADMITTED;
    }
    if (mode != "--check" && mode != "--stream") {
        fmt::print(stderr, "Unknown option: {}\n", mode);
        print_usage();
        return EXIT_ERROR;
    }

    auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return EXIT_ERROR;
    }

    // The policy owner defaults to the router itself.
    const Address owner = opts->owner.value_or(*opts->router);
    auto made = OwnershipGuard::create(owner);
    if (const auto* refused = std::get_if<dxg::Violation>(&made)) {
        fmt::print(stderr, "Error: invalid owner: {}\n", dxg::to_string(*refused));
        return EXIT_ERROR;
    }
    const auto& owners = std::get<OwnershipGuard>(made);

    std::unique_ptr<Clock> clock;
    if (opts->now) {
        clock = std::make_unique<FixedClock>(*opts->now);
    } else {
        clock = std::make_unique<SystemClock>();
    }

    try {
        const RouterGuard guard(opts->policy, owners, *clock);
        if (opts->mode == "--check") {
            return run_check(guard, opts->csv_path);
        }
        return run_stream(guard);
    } catch (const dxg::ValidationFailure& e) {
        fmt::print(stderr, "Error: invalid policy: {}\n", e.what());
        return EXIT_ERROR;
    }
}
