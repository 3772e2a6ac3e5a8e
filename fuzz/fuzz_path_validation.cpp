/**
 * @file  fuzz_path_validation.cpp
 * @brief libFuzzer target for path_well_formed
 *
 * Build:
 *   cmake -DDXG_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_path_validation
 *
 * Input layout:
 *   byte 0       → max path length
 *   bytes 1..    → hops; each byte b becomes an address tagged b
 *                  (0 is the null address)
 *
 * Invariants:
 *   1. A DuplicateAddressInPath payload names i < j with path[i] == path[j].
 *   2. An InvalidAddress payload is the null address.
 *   3. An admitted path has distinct nonzero hops and a legal length.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>

#include "dxg/validation.hpp"

using namespace dxg;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0) {
        return 0;
    }

    const std::size_t max_len = data[0];
    Path path;
    for (std::size_t k = 1; k < size; ++k) {
        path.push_back(data[k] == 0 ? Address::zero() : Address::from_tag(data[k]));
    }

    const auto s = validation::path_well_formed(path, max_len);
    if (!s) {
        assert(path.size() >= constants::MIN_PATH_LENGTH);
        assert(path.size() <= max_len);
        for (std::size_t i = 0; i < path.size(); ++i) {
            assert(!path[i].is_zero());
            for (std::size_t j = i + 1; j < path.size(); ++j) {
                assert(!(path[i] == path[j]));
            }
        }
        return 0;
    }

    if (const auto* dup = std::get_if<DuplicateAddressInPath>(&*s)) {
        assert(dup->i < dup->j);
        assert(dup->j < path.size());
        assert(path[dup->i] == path[dup->j]);
    } else if (const auto* bad = std::get_if<InvalidAddress>(&*s)) {
        assert(bad->address.is_zero());
    } else {
        assert(std::holds_alternative<InvalidPath>(*s));
    }
    return 0;
}
