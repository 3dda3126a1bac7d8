#pragma once

/// @file include/rebal/membership.hpp
/// @brief Turnover-controlling transition from current holdings to the next
///        holding set.
///
/// # Module: MembershipPolicy
///
/// ## Transition (evaluated once per rebalance)
/// 1. Keep holdings ranked ≤ `top_k`, then holdings ranked ≤ `buffer_rank`.
/// 2. Keep holdings with `periods_held < min_holding_periods`. These never
///    count against the removal budget.
/// 3. Holdings listed as forced exits (no longer eligible) leave
///    unconditionally. They bypass the removal cap and the turnover budget
///    and free their slot before additions are sized.
///    The rest are removal candidates, worst rank first (unranked = +∞,
///    ties by identifier). Up to `max_removed_assets` are removed; the
///    remainder is force-kept.
/// 4. Non-held candidates are added best rank first while the result is
///    below `top_k`, at most `max_new_assets` of them.
/// 5. With `max_turnover` set and a non-empty current portfolio,
///    `adds + removes ≤ ⌊max_turnover · |current|⌋`. Excess changes are
///    deferred, taking the worst add while adds ≥ removes and otherwise the
///    best-ranked removal.
///
/// Precedence when limits collide: hold period > removal cap > turnover cap.
/// The result always satisfies
///     |current ∩ retained| ≤ |next| ≤ max(top_k, |retained|).
///
/// The policy is a pure function of its inputs.

#include "rebal/preselection.hpp"
#include "rebal/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace rebal::membership {

// ─── Holdings ─────────────────────────────────────────────────────────────────

struct HoldingRecord {
    AssetId                    asset_id;
    Date                       entry_date;
    int                        periods_held = 0;
    std::optional<std::size_t> last_rank;  ///< Rank at the last rebalance; empty if unranked

    bool operator==(const HoldingRecord&) const = default;
};

/// Holdings keyed (and ordered) by asset identifier.
using HoldingBook = std::map<AssetId, HoldingRecord>;

// ─── Configuration ────────────────────────────────────────────────────────────

struct MembershipConfig {
    bool                  enabled             = true;
    std::optional<int>    buffer_rank;
    int                   min_holding_periods = 0;
    std::optional<double> max_turnover;
    std::optional<int>    max_new_assets;
    std::optional<int>    max_removed_assets;

    /// # Throws
    /// `ConfigurationError` unless `buffer_rank >= 1`,
    /// `min_holding_periods >= 0`, `max_turnover ∈ [0, 1]`,
    /// `max_new_assets >= 0` and `max_removed_assets >= 0`.
    void validate() const;

    /// Conservative defaults: hold 3 periods, 30% turnover, 5 in / 5 out.
    [[nodiscard]] static MembershipConfig default_policy();

    /// Pass-through: the next holdings are the `top_k` best candidates.
    [[nodiscard]] static MembershipConfig disabled();
};

// ─── Decision ─────────────────────────────────────────────────────────────────

enum class RetainReason {
    Rank,              ///< Within top_k
    Buffer,            ///< Within buffer_rank
    HoldPeriod,        ///< Minimum holding period not yet served
    RemovalCap,        ///< Would be removed, max_removed_assets reached
    TurnoverDeferral,  ///< Removal deferred by the turnover cap
};

enum class SkipKind {
    AdditionCapReached,
    RemovalCapReached,
    TurnoverDeferredAdd,
    TurnoverDeferredRemoval,
};

[[nodiscard]] std::string_view to_string(RetainReason reason) noexcept;
[[nodiscard]] std::string_view to_string(SkipKind kind) noexcept;

struct RetainedAsset {
    AssetId      asset_id;
    RetainReason reason;

    bool operator==(const RetainedAsset&) const = default;
};

/// A change the policy wanted to make but did not.
struct PolicySkip {
    AssetId                    asset_id;
    SkipKind                   kind;
    std::optional<std::size_t> rank;

    bool operator==(const PolicySkip&) const = default;
};

struct MembershipDecision {
    std::vector<AssetId>       next_holdings;  ///< Sorted by identifier
    std::vector<AssetId>       added;          ///< Best rank first
    std::vector<AssetId>       removed;        ///< Worst rank first
    std::vector<RetainedAsset> retained;       ///< Current holdings kept, by identifier
    std::vector<PolicySkip>    skips;
    double                     turnover = 0.0; ///< (adds + removes) / max(|current|, 1)

    bool operator==(const MembershipDecision&) const = default;
};

// ─── MembershipPolicy ─────────────────────────────────────────────────────────

class MembershipPolicy {
public:
    /// # Throws
    /// `ConfigurationError` if `config` is invalid.
    explicit MembershipPolicy(MembershipConfig config);

    /// Compute the next holding set. `ranked` must be in rank order (as
    /// produced by `Preselection::rank`). `top_k == 0` means "all ranked".
    /// Holdings in `forced_exits` are removed unless the holding period
    /// protects them (see step 3).
    [[nodiscard]] MembershipDecision
    apply(const HoldingBook&                               current,
          std::span<const preselection::RankedCandidate>   ranked,
          std::size_t                                      top_k,
          std::span<const AssetId>                         forced_exits = {}) const;

    /// Apply `decision` to `book`: erase removals, open additions at
    /// `periods_held = 0`, advance retained holdings by one period and record
    /// their latest rank. O(|book| + |decision|).
    static void commit(HoldingBook&                                   book,
                       const MembershipDecision&                      decision,
                       Date                                           date,
                       std::span<const preselection::RankedCandidate> ranked);

    [[nodiscard]] const MembershipConfig& config() const noexcept { return config_; }

private:
    MembershipConfig config_;
};

}  // namespace rebal::membership
