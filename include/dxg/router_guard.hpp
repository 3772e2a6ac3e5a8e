#pragma once

/// @file include/dxg/router_guard.hpp
/// @brief Router Guard: admission checks for each router operation.
///
/// # Module: Router Guard
///
/// ## Responsibility
/// Compose the Validation Engine checks into the fixed sequence each router
/// operation runs before touching any pool state, and gate administrative
/// policy changes behind the Ownership Guard.
///
/// ```
///   RouterRequest ──► read clock once ──► deadline ──► operation checks
///                                                    ──► recipient ──► admit
/// ```
///
/// ## Usage
/// ```cpp
/// SystemClock clock;
/// auto made = OwnershipGuard::create(owner);
/// auto& owners = std::get<OwnershipGuard>(made);
/// RouterGuard guard(RouterPolicy{.factory = f, .router = r}, owners, clock);
/// if (auto v = guard.admit(request)) {
///     fmt::print(stderr, "rejected: {}\n", to_string(*v));
/// }
/// ```
///
/// ## Guarantees
/// - Admission is all-or-nothing: the first violated rule is returned and
///   nothing is recorded
/// - Ambient time is read exactly once per admission call
/// - `update_policy` changes nothing unless the caller owns the router and
///   the new policy is itself valid

#include "dxg/constants.hpp"
#include "dxg/ownership.hpp"
#include "dxg/types.hpp"
#include "dxg/violation.hpp"

#include <string_view>
#include <variant>
#include <vector>

namespace dxg::router {

// ─── Clock ────────────────────────────────────────────────────────────────────

/// Source of ambient time.
class Clock {
public:
    virtual ~Clock() = default;

    /// Current time in seconds.
    [[nodiscard]] virtual Timestamp now() const noexcept = 0;
};

/// Wall-clock seconds since the Unix epoch.
class SystemClock final : public Clock {
public:
    [[nodiscard]] Timestamp now() const noexcept override;
};

/// A clock that only moves when told to.
class FixedClock final : public Clock {
public:
    explicit FixedClock(Timestamp now = 0) noexcept : now_(now) {}

    [[nodiscard]] Timestamp now() const noexcept override { return now_; }

    void set(Timestamp now) noexcept { now_ = now; }
    void advance(Timestamp seconds) noexcept { now_ += seconds; }

private:
    Timestamp now_;
};

// ─── RouterPolicy ─────────────────────────────────────────────────────────────

/// Tunable admission policy.
struct RouterPolicy {
    /// Pair factory; never a valid recipient.
    Address factory{};

    /// The router itself; never a valid recipient.
    Address router{};

    /// Longest swap path admitted.
    std::size_t max_path_length = constants::DEFAULT_MAX_PATH_LENGTH;

    /// Furthest a deadline may lie in the future, in seconds.
    Timestamp max_deadline_extension = constants::DEFAULT_MAX_DEADLINE_EXTENSION;

    /// Per-side floor for liquidity deposits.
    Amount minimum_liquidity = constants::MINIMUM_LIQUIDITY;

    /// Most legs admitted in one multi-swap.
    std::size_t max_batch_size = constants::DEFAULT_MAX_BATCH_SIZE;

    /// If true, log every rejection to stderr.
    bool verbose = false;
};

// ─── Requests ─────────────────────────────────────────────────────────────────

struct AddLiquidityRequest {
    Address   token_a;
    Address   token_b;
    Amount    amount_a_desired;
    Amount    amount_b_desired;
    Amount    amount_a_min;
    Amount    amount_b_min;
    Address   to;
    Timestamp deadline;
};

struct RemoveLiquidityRequest {
    Address   token_a;
    Address   token_b;
    Amount    liquidity;     ///< LP tokens to burn
    Amount    amount_a_min;
    Amount    amount_b_min;
    Address   to;
    Timestamp deadline;
};

/// Sell exactly `amount_in` of path[0].
struct SwapExactInRequest {
    Amount    amount_in;
    Amount    amount_out_min;  ///< Zero accepts any output
    Path      path;
    Address   to;
    Timestamp deadline;
};

/// Buy exactly `amount_out` of path.back().
struct SwapExactOutRequest {
    Amount    amount_out;
    Amount    amount_in_max;
    Path      path;
    Address   to;
    Timestamp deadline;
};

/// Several exact-in swaps settled to one recipient. The three vectors are
/// parallel: leg `k` sells `amounts_in[k]` along `paths[k]`.
struct MultiSwapRequest {
    std::vector<Amount> amounts_in;
    std::vector<Amount> amounts_out_min;
    std::vector<Path>   paths;
    Address             to;
    Timestamp           deadline;
};

using RouterRequest = std::variant<
    AddLiquidityRequest,
    RemoveLiquidityRequest,
    SwapExactInRequest,
    SwapExactOutRequest,
    MultiSwapRequest>;

/// Operation name of a request, e.g. "swap_exact_in".
[[nodiscard]] std::string_view operation_name(const RouterRequest& request) noexcept;

// ─── RouterGuard ──────────────────────────────────────────────────────────────

/// Admission front door for the router's business logic.
///
/// Holds references to the ownership cell and the clock; both must outlive
/// the guard.
class RouterGuard {
public:
    /// Install `policy`. Throws `ValidationFailure` when `validate_policy`
    /// refuses it.
    RouterGuard(RouterPolicy policy,
                const ownership::OwnershipGuard& owners,
                const Clock& clock);

    /// deadline → token pair → liquidity amounts → recipient.
    [[nodiscard]] Status admit_add_liquidity(const AddLiquidityRequest& req) const;

    /// deadline → token pair → liquidity > 0 → recipient.
    [[nodiscard]] Status admit_remove_liquidity(const RemoveLiquidityRequest& req) const;

    /// deadline → swap amounts (amount_in, path) → recipient.
    [[nodiscard]] Status admit_swap_exact_in(const SwapExactInRequest& req) const;

    /// deadline → amount_out > 0 → amount_in_max > 0 → path → recipient.
    [[nodiscard]] Status admit_swap_exact_out(const SwapExactOutRequest& req) const;

    /// deadline → batch size → parallel lengths → each leg → recipient.
    [[nodiscard]] Status admit_multi_swap(const MultiSwapRequest& req) const;

    /// Dispatch on the request type.
    [[nodiscard]] Status admit(const RouterRequest& request) const;

    /// Replace the admission policy. Owner only.
    ///
    /// # Failure
    /// - `Unauthorized(caller)`
    /// - `InvalidAddress` for a null or shared factory/router
    /// - `InvalidPath(max_path_length, 2, max_path_length)` if below 2
    /// - `InvalidAmount` for a zero deadline extension or batch size
    [[nodiscard]] Status update_policy(const Address& caller, const RouterPolicy& policy);

    /// Policy currently in force.
    [[nodiscard]] const RouterPolicy& policy() const noexcept { return policy_; }

    /// Ownership cell gating `update_policy`.
    [[nodiscard]] const ownership::OwnershipGuard& owners() const noexcept { return owners_; }

    /// Check a policy without installing it.
    [[nodiscard]] static Status validate_policy(const RouterPolicy& policy) noexcept;

private:
    /// Log `violation` under `operation` when verbose; pass it through.
    Status report(std::string_view operation, Status status) const;

    [[nodiscard]] Status check_add_liquidity(const AddLiquidityRequest& req,
                                             Timestamp now) const noexcept;
    [[nodiscard]] Status check_remove_liquidity(const RemoveLiquidityRequest& req,
                                                Timestamp now) const noexcept;
    [[nodiscard]] Status check_swap_exact_in(const SwapExactInRequest& req,
                                             Timestamp now) const noexcept;
    [[nodiscard]] Status check_swap_exact_out(const SwapExactOutRequest& req,
                                              Timestamp now) const noexcept;
    [[nodiscard]] Status check_multi_swap(const MultiSwapRequest& req,
                                          Timestamp now) const noexcept;

    RouterPolicy               policy_;
    const ownership::OwnershipGuard& owners_;
    const Clock&               clock_;
};

}  // namespace dxg::router
