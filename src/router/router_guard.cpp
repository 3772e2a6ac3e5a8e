/// @file src/router/router_guard.cpp
/// @brief RouterGuard: per-operation admission sequences.

#include "dxg/router_guard.hpp"
#include "dxg/validation.hpp"

#include <fmt/core.h>

#include <chrono>
#include <cstdio>
#include <type_traits>
#include <utility>

namespace dxg::router {

namespace chk = dxg::validation;

// ─── SystemClock ──────────────────────────────────────────────────────────────

Timestamp SystemClock::now() const noexcept {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count();
    return secs < 0 ? Timestamp{0} : static_cast<Timestamp>(secs);
}

// ─── operation_name ───────────────────────────────────────────────────────────

std::string_view operation_name(const RouterRequest& request) noexcept {
    return std::visit([](const auto& r) -> std::string_view {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, AddLiquidityRequest>)         return "add_liquidity";
        else if constexpr (std::is_same_v<T, RemoveLiquidityRequest>) return "remove_liquidity";
        else if constexpr (std::is_same_v<T, SwapExactInRequest>)     return "swap_exact_in";
        else if constexpr (std::is_same_v<T, SwapExactOutRequest>)    return "swap_exact_out";
        else                                                          return "multi_swap";
    }, request);
}

// ─── RouterGuard constructor ──────────────────────────────────────────────────

RouterGuard::RouterGuard(RouterPolicy policy,
                         const ownership::OwnershipGuard& owners,
                         const Clock& clock)
    : policy_(std::move(policy))
    , owners_(owners)
    , clock_(clock)
{
    enforce(validate_policy(policy_));
}

// ─── Public admission entry points ────────────────────────────────────────────
//
// Each reads the clock once and hands the same `now` to every sub-check.

Status RouterGuard::admit_add_liquidity(const AddLiquidityRequest& req) const {
    return report("add_liquidity", check_add_liquidity(req, clock_.now()));
}

Status RouterGuard::admit_remove_liquidity(const RemoveLiquidityRequest& req) const {
    return report("remove_liquidity", check_remove_liquidity(req, clock_.now()));
}

Status RouterGuard::admit_swap_exact_in(const SwapExactInRequest& req) const {
    return report("swap_exact_in", check_swap_exact_in(req, clock_.now()));
}

Status RouterGuard::admit_swap_exact_out(const SwapExactOutRequest& req) const {
    return report("swap_exact_out", check_swap_exact_out(req, clock_.now()));
}

Status RouterGuard::admit_multi_swap(const MultiSwapRequest& req) const {
    return report("multi_swap", check_multi_swap(req, clock_.now()));
}

Status RouterGuard::admit(const RouterRequest& request) const {
    return std::visit([this](const auto& req) -> Status {
        using T = std::decay_t<decltype(req)>;
        if constexpr (std::is_same_v<T, AddLiquidityRequest>)         return admit_add_liquidity(req);
        else if constexpr (std::is_same_v<T, RemoveLiquidityRequest>) return admit_remove_liquidity(req);
        else if constexpr (std::is_same_v<T, SwapExactInRequest>)     return admit_swap_exact_in(req);
        else if constexpr (std::is_same_v<T, SwapExactOutRequest>)    return admit_swap_exact_out(req);
        else                                                          return admit_multi_swap(req);
    }, request);
}

// ─── RouterGuard::update_policy ───────────────────────────────────────────────

Status RouterGuard::update_policy(const Address& caller, const RouterPolicy& policy) {
    if (auto v = owners_.require_owner(caller)) {
        return report("update_policy", std::move(v));
    }
    if (auto v = validate_policy(policy)) {
        return report("update_policy", std::move(v));
    }

    policy_ = policy;
    if (policy_.verbose) {
        fmt::print(stderr,
                   "[dxg] policy updated by {}: max_path={} max_extension={}s "
                   "min_liquidity={} max_batch={}\n",
                   caller.to_hex(), policy_.max_path_length,
                   policy_.max_deadline_extension, policy_.minimum_liquidity,
                   policy_.max_batch_size);
    }
    return std::nullopt;
}

// ─── RouterGuard::validate_policy ─────────────────────────────────────────────

Status RouterGuard::validate_policy(const RouterPolicy& policy) noexcept {
    if (auto v = chk::identity_exists(policy.factory)) return v;
    if (auto v = chk::identity_exists(policy.router)) return v;
    if (auto v = chk::identity_not_protected(policy.router, policy.factory)) return v;

    if (policy.max_path_length < constants::MIN_PATH_LENGTH) {
        return InvalidPath{policy.max_path_length, constants::MIN_PATH_LENGTH,
                           policy.max_path_length};
    }
    if (auto v = chk::amount_positive(policy.max_deadline_extension)) return v;
    if (auto v = chk::amount_positive(static_cast<Amount>(policy.max_batch_size))) return v;
    return std::nullopt;
}

// ─── RouterGuard::report ──────────────────────────────────────────────────────

Status RouterGuard::report(std::string_view operation, Status status) const {
    if (status && policy_.verbose) {
        fmt::print(stderr, "[dxg] {} rejected: {}\n", operation, to_string(*status));
    }
    return status;
}

// ─── Per-operation sequences ──────────────────────────────────────────────────

Status RouterGuard::check_add_liquidity(const AddLiquidityRequest& req,
                                        Timestamp now) const noexcept {
    if (auto v = chk::deadline_valid(req.deadline, now, policy_.max_deadline_extension)) return v;
    if (auto v = chk::token_pair_valid(req.token_a, req.token_b)) return v;
    if (auto v = chk::liquidity_amounts_valid(req.amount_a_desired, req.amount_b_desired,
                                              req.amount_a_min, req.amount_b_min,
                                              policy_.minimum_liquidity)) return v;
    return chk::recipient_valid(req.to, policy_.factory, policy_.router);
}

Status RouterGuard::check_remove_liquidity(const RemoveLiquidityRequest& req,
                                           Timestamp now) const noexcept {
    if (auto v = chk::deadline_valid(req.deadline, now, policy_.max_deadline_extension)) return v;
    if (auto v = chk::token_pair_valid(req.token_a, req.token_b)) return v;
    if (auto v = chk::amount_positive(req.liquidity)) return v;
    return chk::recipient_valid(req.to, policy_.factory, policy_.router);
}

Status RouterGuard::check_swap_exact_in(const SwapExactInRequest& req,
                                        Timestamp now) const noexcept {
    if (auto v = chk::deadline_valid(req.deadline, now, policy_.max_deadline_extension)) return v;
    if (auto v = chk::swap_amounts_valid(req.amount_in, req.amount_out_min, req.path,
                                         policy_.max_path_length)) return v;
    return chk::recipient_valid(req.to, policy_.factory, policy_.router);
}

Status RouterGuard::check_swap_exact_out(const SwapExactOutRequest& req,
                                         Timestamp now) const noexcept {
    if (auto v = chk::deadline_valid(req.deadline, now, policy_.max_deadline_extension)) return v;
    if (auto v = chk::amount_positive(req.amount_out)) return v;
    if (auto v = chk::amount_positive(req.amount_in_max)) return v;
    if (auto v = chk::path_well_formed(req.path, policy_.max_path_length)) return v;
    return chk::recipient_valid(req.to, policy_.factory, policy_.router);
}

Status RouterGuard::check_multi_swap(const MultiSwapRequest& req,
                                     Timestamp now) const noexcept {
    if (auto v = chk::deadline_valid(req.deadline, now, policy_.max_deadline_extension)) return v;
    if (auto v = chk::sequence_length_bounded(req.paths.size(), policy_.max_batch_size)) return v;
    if (auto v = chk::arrays_length_match(req.paths, req.amounts_in)) return v;
    if (auto v = chk::arrays_length_match(req.paths, req.amounts_out_min)) return v;

    for (std::size_t k = 0; k < req.paths.size(); ++k) {
        if (auto v = chk::swap_amounts_valid(req.amounts_in[k], req.amounts_out_min[k],
                                             req.paths[k], policy_.max_path_length)) {
            return v;
        }
    }
    return chk::recipient_valid(req.to, policy_.factory, policy_.router);
}

}  // namespace dxg::router
