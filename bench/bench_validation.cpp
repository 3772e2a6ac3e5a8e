/**
 * @file  bench/bench_validation.cpp
 * @brief Google Benchmark suite for the DXG admission checks.
 *
 * Benchmarks
 * ----------
 *   BM_PathWellFormed          quadratic duplicate scan, by path length
 *   BM_LiquidityAmountsValid   full add-liquidity amount composite
 *   BM_AdmitSwapExactIn        one admission through RouterGuard
 *   BM_AdmitMultiSwap          batch admission, by leg count
 *   BM_RequestLoaderParseRow   one CSV row into a request
 *
 * Build (CMake):
 *   cmake -DDXG_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_validation
 *   ./build/bench_validation --benchmark_format=json
 */

#include "benchmark/benchmark.h"

#include "dxg/request_loader.hpp"
#include "dxg/router_guard.hpp"
#include "dxg/validation.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

using namespace dxg;
using namespace dxg::router;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Path of n distinct tagged hops.
static Path make_path(std::size_t n) {
    Path p;
    for (std::size_t i = 0; i < n; ++i) {
        p.push_back(Address::from_tag(static_cast<std::uint8_t>(i + 1)));
    }
    return p;
}

static RouterPolicy bench_policy(std::size_t max_path) {
    RouterPolicy p{.factory = Address::from_tag(0xF0), .router = Address::from_tag(0xE0)};
    p.max_path_length = max_path;
    return p;
}

// ── Path validation ────────────────────────────────────────────────────────────

static void BM_PathWellFormed(benchmark::State& state) {
    const auto n    = static_cast<std::size_t>(state.range(0));
    const auto path = make_path(n);
    for (auto _ : state) {
        benchmark::DoNotOptimize(validation::path_well_formed(path, n));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_PathWellFormed)->RangeMultiplier(2)->Range(2, 128);

static void BM_LiquidityAmountsValid(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(
            validation::liquidity_amounts_valid(10'000, 20'000, 9'900, 19'800));
    }
}
BENCHMARK(BM_LiquidityAmountsValid);

// ── RouterGuard ────────────────────────────────────────────────────────────────

static void BM_AdmitSwapExactIn(benchmark::State& state) {
    auto made = ownership::OwnershipGuard::create(Address::from_tag(0x01));
    const auto& owners = std::get<ownership::OwnershipGuard>(made);
    const FixedClock clock(1'000'000);
    const RouterGuard guard(bench_policy(4), owners, clock);

    const SwapExactInRequest req{
        .amount_in      = 5'000,
        .amount_out_min = 1,
        .path           = make_path(4),
        .to             = Address::from_tag(0x42),
        .deadline       = 1'000'600,
    };
    for (auto _ : state) {
        benchmark::DoNotOptimize(guard.admit_swap_exact_in(req));
    }
}
BENCHMARK(BM_AdmitSwapExactIn);

static void BM_AdmitMultiSwap(benchmark::State& state) {
    const auto legs = static_cast<std::size_t>(state.range(0));
    auto policy = bench_policy(4);
    policy.max_batch_size = legs;

    auto made = ownership::OwnershipGuard::create(Address::from_tag(0x01));
    const auto& owners = std::get<ownership::OwnershipGuard>(made);
    const FixedClock clock(1'000'000);
    const RouterGuard guard(policy, owners, clock);

    MultiSwapRequest req{.to = Address::from_tag(0x42), .deadline = 1'000'600};
    for (std::size_t k = 0; k < legs; ++k) {
        req.amounts_in.push_back(1'000 + k);
        req.amounts_out_min.push_back(1);
        req.paths.push_back(make_path(4));
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(guard.admit_multi_swap(req));
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(legs));
}
BENCHMARK(BM_AdmitMultiSwap)->RangeMultiplier(2)->Range(1, 64);

// ── RequestLoader ──────────────────────────────────────────────────────────────

static void BM_RequestLoaderParseRow(benchmark::State& state) {
    const std::string row =
        "swap_exact_in,5000,1," + Address::from_tag(0x0A).to_hex() + ">" +
        Address::from_tag(0x0B).to_hex() + "," + Address::from_tag(0x42).to_hex() +
        ",1000600";
    for (auto _ : state) {
        benchmark::DoNotOptimize(core::RequestLoader::parse_row(row));
    }
}
BENCHMARK(BM_RequestLoaderParseRow);

BENCHMARK_MAIN();
