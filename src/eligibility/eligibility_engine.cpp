/// @file src/eligibility/eligibility_engine.cpp
/// @brief EligibilityEngine implementation.

#include "rebal/eligibility.hpp"
#include "rebal/errors.hpp"

#include "core/parallel.hpp"

#include <algorithm>
#include <utility>

namespace rebal::eligibility {

std::string_view to_string(EligibilityReason reason) noexcept {
    switch (reason) {
        case EligibilityReason::Eligible:            return "eligible";
        case EligibilityReason::UnknownAsset:        return "unknown_asset";
        case EligibilityReason::NoObservations:      return "no_observations";
        case EligibilityReason::InsufficientHistory: return "insufficient_history";
        case EligibilityReason::InsufficientRows:    return "insufficient_rows";
        case EligibilityReason::Delisted:            return "delisted";
    }
    return "unknown";
}

void EligibilityConfig::validate() const {
    if (min_history_days < 0) {
        throw ConfigurationError("eligibility.min_history_days", "must be >= 0");
    }
    if (min_price_rows < 0) {
        throw ConfigurationError("eligibility.min_price_rows", "must be >= 0");
    }
    if (lookforward_days < 1) {
        throw ConfigurationError("eligibility.lookforward_days", "must be >= 1");
    }
}

EligibilityEngine::EligibilityEngine(const HistoryTracker& history, EligibilityConfig config)
    : history_(history)
    , config_(std::move(config)) {
    config_.validate();
}

// ─── Delisting ────────────────────────────────────────────────────────────────

bool EligibilityEngine::delisted_after(std::size_t column, Date last_seen) const {
    const Date horizon = add_days(last_seen, config_.lookforward_days);

    // A print on the final date of the data is the latest anything can show.
    const auto table_end = history_.table().last_date();
    if (!table_end || last_seen >= *table_end) return false;

    const auto next = history_.table().series(column).first_after(last_seen);
    return !next || next->date > horizon;
}

bool EligibilityEngine::is_delisted(const AssetId& asset, Date check_date) const {
    const auto col = history_.table().column_of(asset);
    if (!col) return false;
    const auto last = history_.table().series(*col).last_through(check_date);
    if (!last) return false;
    return delisted_after(*col, last->date);
}

// ─── Single decision ──────────────────────────────────────────────────────────

EligibilityRecord EligibilityEngine::is_eligible(const AssetId& asset,
                                                 Date           check_date,
                                                 int            min_history_days,
                                                 int            min_price_rows) const {
    EligibilityRecord rec{.asset_id = asset, .check_date = check_date,
                          .eligible = false, .reason = EligibilityReason::UnknownAsset};

    const auto col = history_.table().column_of(asset);
    if (!col) return rec;

    // The incremental state is authoritative when the tracker sits on the
    // check date; otherwise answer from an equivalent pure snapshot.
    const auto state = history_.current_date() == check_date
        ? history_.state(asset)
        : history_.snapshot_at(asset, check_date);
    if (!state || !state->observed()) {
        rec.reason = EligibilityReason::NoObservations;
        return rec;
    }

    if (delisted_after(*col, *state->last_seen_date)) {
        rec.reason = EligibilityReason::Delisted;
        return rec;
    }
    if (days_between(*state->first_seen_date, check_date) < min_history_days) {
        rec.reason = EligibilityReason::InsufficientHistory;
        return rec;
    }
    if (state->observation_count < static_cast<std::size_t>(std::max(min_price_rows, 0))) {
        rec.reason = EligibilityReason::InsufficientRows;
        return rec;
    }

    rec.eligible = true;
    rec.reason   = EligibilityReason::Eligible;
    return rec;
}

EligibilityRecord EligibilityEngine::is_eligible(const AssetId& asset, Date check_date) const {
    return is_eligible(asset, check_date, config_.min_history_days, config_.min_price_rows);
}

// ─── Batch ────────────────────────────────────────────────────────────────────

std::vector<EligibilityRecord>
EligibilityEngine::evaluate_all(Date check_date, std::size_t threads) const {
    const auto assets = history_.table().assets();
    std::vector<EligibilityRecord> out(assets.size());
    core::parallel_for(assets.size(), threads, [&](std::size_t i) {
        out[i] = is_eligible(assets[i], check_date);
    });
    return out;
}

std::vector<AssetId>
EligibilityEngine::eligible_assets(Date check_date, std::size_t threads) const {
    std::vector<AssetId> out;
    for (auto& rec : evaluate_all(check_date, threads)) {
        if (rec.eligible) out.push_back(std::move(rec.asset_id));
    }
    return out;
}

}  // namespace rebal::eligibility
