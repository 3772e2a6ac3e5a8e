/**
 * @file  fuzz_request_loader.cpp
 * @brief libFuzzer target for RequestLoader → RouterGuard (end-to-end)
 *
 * Build:
 *   cmake -DDXG_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_request_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_request_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every parsed request yields a verdict, and the same verdict when
 *      admitted twice against the same clock.
 *   3. Every violation renders to a non-empty diagnostic.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>

#include "dxg/request_loader.hpp"
#include "dxg/router_guard.hpp"

using namespace dxg;
using namespace dxg::router;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    const auto requests = core::RequestLoader::parse_csv_string(input);
    if (requests.empty()) {
        return 0;
    }

    auto made = ownership::OwnershipGuard::create(Address::from_tag(0x01));
    const auto& owners = std::get<ownership::OwnershipGuard>(made);
    const FixedClock clock(1'000'000);
    const RouterGuard guard(
        RouterPolicy{.factory = Address::from_tag(0xF0), .router = Address::from_tag(0xE0)},
        owners, clock);

    for (const auto& request : requests) {
        const auto first  = guard.admit(request);
        const auto second = guard.admit(request);
        assert(first == second);
        if (first) {
            assert(!to_string(*first).empty());
            assert(!kind_name(*first).empty());
        }
    }
    return 0;
}
