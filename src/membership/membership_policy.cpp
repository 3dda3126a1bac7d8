/// @file src/membership/membership_policy.cpp
/// @brief MembershipPolicy implementation.

#include "rebal/membership.hpp"
#include "rebal/errors.hpp"
#include "rebal/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <unordered_map>
#include <utility>

namespace rebal::membership {

namespace {

constexpr std::size_t UNRANKED = std::numeric_limits<std::size_t>::max();

using RankMap = std::unordered_map<AssetId, std::size_t>;

[[nodiscard]] RankMap index_ranks(std::span<const preselection::RankedCandidate> ranked) {
    RankMap ranks;
    ranks.reserve(ranked.size());
    for (const auto& c : ranked) ranks.emplace(c.asset_id, c.rank);
    return ranks;
}

[[nodiscard]] std::size_t rank_of(const RankMap& ranks, const AssetId& asset) {
    const auto it = ranks.find(asset);
    return it == ranks.end() ? UNRANKED : it->second;
}

[[nodiscard]] std::optional<std::size_t> as_optional(std::size_t rank) noexcept {
    if (rank == UNRANKED) return std::nullopt;
    return rank;
}

}  // namespace

// ─── Names ────────────────────────────────────────────────────────────────────

std::string_view to_string(RetainReason reason) noexcept {
    switch (reason) {
        case RetainReason::Rank:             return "rank";
        case RetainReason::Buffer:           return "buffer";
        case RetainReason::HoldPeriod:       return "hold_period";
        case RetainReason::RemovalCap:       return "removal_cap";
        case RetainReason::TurnoverDeferral: return "turnover_deferral";
    }
    return "unknown";
}

std::string_view to_string(SkipKind kind) noexcept {
    switch (kind) {
        case SkipKind::AdditionCapReached:      return "addition_cap_reached";
        case SkipKind::RemovalCapReached:       return "removal_cap_reached";
        case SkipKind::TurnoverDeferredAdd:     return "turnover_deferred_add";
        case SkipKind::TurnoverDeferredRemoval: return "turnover_deferred_removal";
    }
    return "unknown";
}

// ─── MembershipConfig ─────────────────────────────────────────────────────────

void MembershipConfig::validate() const {
    if (buffer_rank && *buffer_rank < 1) {
        throw ConfigurationError("membership.buffer_rank", "must be >= 1");
    }
    if (min_holding_periods < 0) {
        throw ConfigurationError("membership.min_holding_periods", "must be >= 0");
    }
    if (max_turnover && !(*max_turnover >= 0.0 && *max_turnover <= 1.0)) {
        throw ConfigurationError("membership.max_turnover", "must be in [0, 1]");
    }
    if (max_new_assets && *max_new_assets < 0) {
        throw ConfigurationError("membership.max_new_assets", "must be >= 0");
    }
    if (max_removed_assets && *max_removed_assets < 0) {
        throw ConfigurationError("membership.max_removed_assets", "must be >= 0");
    }
}

MembershipConfig MembershipConfig::default_policy() {
    MembershipConfig cfg;
    cfg.min_holding_periods = 3;
    cfg.max_turnover        = 0.30;
    cfg.max_new_assets      = 5;
    cfg.max_removed_assets  = 5;
    return cfg;
}

MembershipConfig MembershipConfig::disabled() {
    MembershipConfig cfg;
    cfg.enabled = false;
    return cfg;
}

// ─── MembershipPolicy ─────────────────────────────────────────────────────────

MembershipPolicy::MembershipPolicy(MembershipConfig config) : config_(std::move(config)) {
    config_.validate();
}

MembershipDecision
MembershipPolicy::apply(const HoldingBook&                             current,
                        std::span<const preselection::RankedCandidate> ranked,
                        std::size_t                                    top_k,
                        std::span<const AssetId>                       forced_exits) const {
    if (top_k == 0) top_k = ranked.size();

    const RankMap ranks = index_ranks(ranked);
    const std::set<AssetId> exit_set(forced_exits.begin(), forced_exits.end());
    MembershipDecision decision;

    // ── Disabled: plain top-k ────────────────────────────────────────────────
    if (!config_.enabled) {
        const std::size_t n = std::min(top_k, ranked.size());
        for (std::size_t i = 0; i < n; ++i) {
            decision.next_holdings.push_back(ranked[i].asset_id);
            if (!current.contains(ranked[i].asset_id)) {
                decision.added.push_back(ranked[i].asset_id);
            }
        }
        std::vector<std::pair<std::size_t, AssetId>> gone;
        for (const auto& [asset, rec] : current) {
            const std::size_t r = rank_of(ranks, asset);
            if (r <= n) {
                decision.retained.push_back({asset, RetainReason::Rank});
            } else {
                gone.emplace_back(r, asset);
            }
        }
        std::sort(gone.begin(), gone.end(), [](const auto& a, const auto& b) {
            if (a.first != b.first) return a.first > b.first;
            return a.second < b.second;
        });
        for (auto& g : gone) decision.removed.push_back(std::move(g.second));
        std::sort(decision.next_holdings.begin(), decision.next_holdings.end());
    } else {
        // ── Steps 1-2: protected holdings ────────────────────────────────────
        std::map<AssetId, RetainReason>              kept;
        std::vector<std::pair<std::size_t, AssetId>> removal_candidates;
        std::vector<AssetId>                         exits;

        for (const auto& [asset, rec] : current) {
            const std::size_t r = rank_of(ranks, asset);
            if (exit_set.contains(asset) && rec.periods_held >= config_.min_holding_periods) {
                exits.push_back(asset);
            } else if (r <= top_k) {
                kept.emplace(asset, RetainReason::Rank);
            } else if (config_.buffer_rank &&
                       r <= static_cast<std::size_t>(*config_.buffer_rank)) {
                kept.emplace(asset, RetainReason::Buffer);
            } else if (rec.periods_held < config_.min_holding_periods) {
                kept.emplace(asset, RetainReason::HoldPeriod);
            } else {
                removal_candidates.emplace_back(r, asset);
            }
        }

        // ── Step 3: removals, worst rank first ───────────────────────────────
        std::sort(removal_candidates.begin(), removal_candidates.end(),
                  [](const auto& a, const auto& b) {
                      if (a.first != b.first) return a.first > b.first;
                      return a.second < b.second;
                  });

        const std::size_t removal_cap = config_.max_removed_assets
            ? static_cast<std::size_t>(*config_.max_removed_assets)
            : removal_candidates.size();

        std::vector<std::pair<std::size_t, AssetId>> removals;
        for (auto& [r, asset] : removal_candidates) {
            if (removals.size() < removal_cap) {
                removals.emplace_back(r, asset);
            } else {
                kept.emplace(asset, RetainReason::RemovalCap);
                decision.skips.push_back({asset, SkipKind::RemovalCapReached, as_optional(r)});
            }
        }

        // ── Step 4: additions, best rank first ───────────────────────────────
        const std::size_t slots = top_k > kept.size() ? top_k - kept.size() : 0;
        const std::size_t add_cap = config_.max_new_assets
            ? static_cast<std::size_t>(*config_.max_new_assets)
            : slots;

        std::vector<std::pair<std::size_t, AssetId>> additions;
        std::size_t wanted = 0;
        for (const auto& c : ranked) {
            if (wanted >= slots) break;
            if (current.contains(c.asset_id)) continue;
            ++wanted;
            if (additions.size() < add_cap) {
                additions.emplace_back(c.rank, c.asset_id);
            } else {
                decision.skips.push_back({c.asset_id, SkipKind::AdditionCapReached, c.rank});
            }
        }

        // ── Step 5: turnover cap ─────────────────────────────────────────────
        if (config_.max_turnover && !current.empty()) {
            const auto budget = static_cast<std::size_t>(
                std::floor(*config_.max_turnover * static_cast<double>(current.size()) + 1e-9));

            while (additions.size() + removals.size() > budget) {
                if (!additions.empty() && additions.size() >= removals.size()) {
                    auto& [r, asset] = additions.back();
                    decision.skips.push_back({asset, SkipKind::TurnoverDeferredAdd, r});
                    additions.pop_back();
                } else {
                    auto& [r, asset] = removals.back();
                    kept.emplace(asset, RetainReason::TurnoverDeferral);
                    decision.skips.push_back(
                        {asset, SkipKind::TurnoverDeferredRemoval, as_optional(r)});
                    removals.pop_back();
                }
            }

            // A deferred removal occupies a slot an addition was counting on.
            while (!additions.empty() && kept.size() + additions.size() > top_k) {
                auto& [r, asset] = additions.back();
                decision.skips.push_back({asset, SkipKind::TurnoverDeferredAdd, r});
                additions.pop_back();
            }
        }

        // ── Assemble ─────────────────────────────────────────────────────────
        for (const auto& [asset, reason] : kept) {
            decision.retained.push_back({asset, reason});
            decision.next_holdings.push_back(asset);
        }
        for (auto& a : additions) {
            decision.added.push_back(a.second);
            decision.next_holdings.push_back(std::move(a.second));
        }
        for (auto& a : exits) decision.removed.push_back(std::move(a));
        for (auto& r : removals) decision.removed.push_back(std::move(r.second));
        std::sort(decision.next_holdings.begin(), decision.next_holdings.end());
    }

    const std::size_t changes = decision.added.size() + decision.removed.size();
    if (current.empty()) {
        decision.turnover = changes > 0 ? 1.0 : 0.0;
    } else {
        decision.turnover = static_cast<double>(changes) / static_cast<double>(current.size());
    }

    REBAL_LOG_DEBUG("membership: {} held, +{} -{} kept {} skips {} turnover {:.3f}",
                    current.size(), decision.added.size(), decision.removed.size(),
                    decision.retained.size(), decision.skips.size(), decision.turnover);
    return decision;
}

void MembershipPolicy::commit(HoldingBook&                                   book,
                              const MembershipDecision&                      decision,
                              Date                                           date,
                              std::span<const preselection::RankedCandidate> ranked) {
    const RankMap ranks = index_ranks(ranked);

    for (const auto& asset : decision.removed) {
        book.erase(asset);
    }
    for (const auto& kept : decision.retained) {
        const auto it = book.find(kept.asset_id);
        if (it == book.end()) continue;
        ++it->second.periods_held;
        it->second.last_rank = as_optional(rank_of(ranks, kept.asset_id));
    }
    for (const auto& asset : decision.added) {
        book.insert_or_assign(asset, HoldingRecord{
                                         .asset_id     = asset,
                                         .entry_date   = date,
                                         .periods_held = 0,
                                         .last_rank    = as_optional(rank_of(ranks, asset))});
    }
}

}  // namespace rebal::membership
