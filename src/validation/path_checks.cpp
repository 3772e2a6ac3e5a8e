/// @file src/validation/path_checks.cpp
/// @brief Swap path well-formedness.

#include "dxg/validation.hpp"

namespace dxg::validation {

using constants::MIN_PATH_LENGTH;

// ─── path_well_formed ─────────────────────────────────────────────────────────

Status path_well_formed(std::span<const Address> path,
                        std::size_t max_length) noexcept {
    const std::size_t n = path.size();
    if (n < MIN_PATH_LENGTH || n > max_length) {
        return InvalidPath{n, MIN_PATH_LENGTH, max_length};
    }

    for (const auto& hop : path) {
        if (auto v = identity_exists(hop)) {
            return v;
        }
    }

    // All-pairs scan. Row-major order reports the lowest i, then lowest j.
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            if (path[i] == path[j]) {
                return DuplicateAddressInPath{path[i], i, j};
            }
        }
    }
    return std::nullopt;
}

}  // namespace dxg::validation
