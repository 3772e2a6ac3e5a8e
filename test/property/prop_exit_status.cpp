/**
 * @file  prop_exit_status.cpp
 * @brief A property that is false by construction.
 *
 * Registered with CTest as WILL_FAIL: it passes only when a failing
 * rc::check makes the program exit nonzero, which every other property
 * program relies on to report its own failures.
 */

#include <rapidcheck.h>

#include "dxg/validation.hpp"

using namespace dxg;
using namespace dxg::validation;

int main() {
    bool ok = true;

    ok &= rc::check(
        "exit_status: amount_positive admits zero (false)",
        []() {
            RC_ASSERT(!amount_positive(0).has_value());
        }
    );

    return ok ? 0 : 1;
}
