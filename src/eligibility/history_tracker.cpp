/// @file src/eligibility/history_tracker.cpp
/// @brief HistoryTracker implementation.

#include "rebal/history.hpp"

#include <utility>

namespace rebal::eligibility {

HistoryTracker::HistoryTracker(const core::PriceTable& table, std::int64_t gap_days)
    : table_(table)
    , gap_days_(gap_days)
    , tracks_(table.assets().size()) {
    gap_index_.reserve(tracks_.size());
    for (std::size_t c = 0; c < tracks_.size(); ++c) {
        const auto pts = table_.series(c).points();
        std::vector<std::optional<Date>> gaps(pts.size());
        for (std::size_t k = 1; k < pts.size(); ++k) {
            gaps[k] = days_between(pts[k - 1].date, pts[k].date) > gap_days_
                          ? std::optional<Date>{pts[k - 1].date}
                          : gaps[k - 1];
        }
        gap_index_.push_back(std::move(gaps));
    }
}

// ─── Incremental path ─────────────────────────────────────────────────────────

void HistoryTracker::advance_to(Date d) {
    if (current_ && d <= *current_) return;

    for (std::size_t c = 0; c < tracks_.size(); ++c) {
        auto& track = tracks_[c];
        const auto pts = table_.series(c).points();
        while (track.cursor < pts.size() && pts[track.cursor].date <= d) {
            const Date obs = pts[track.cursor].date;
            auto& st = track.state;
            if (!st.first_seen_date) {
                st.first_seen_date = obs;
            } else if (days_between(*st.last_seen_date, obs) > gap_days_) {
                st.last_gap_start = st.last_seen_date;
            }
            st.last_seen_date = obs;
            ++st.observation_count;
            ++track.cursor;
        }
    }
    current_ = d;
}

std::optional<AssetHistoryState> HistoryTracker::state(const AssetId& asset) const {
    const auto col = table_.column_of(asset);
    if (!col) return std::nullopt;
    return tracks_[*col].state;
}

void HistoryTracker::reset() {
    for (auto& track : tracks_) {
        track = Track{};
    }
    current_.reset();
}

// ─── Pure path ────────────────────────────────────────────────────────────────

AssetHistoryState HistoryTracker::state_from_count(std::size_t column, std::size_t n) const {
    AssetHistoryState st;
    if (n == 0) return st;
    const auto pts = table_.series(column).points();
    st.first_seen_date   = pts.front().date;
    st.last_seen_date    = pts[n - 1].date;
    st.observation_count = n;
    st.last_gap_start    = gap_index_[column][n - 1];
    return st;
}

std::optional<AssetHistoryState>
HistoryTracker::snapshot_at(const AssetId& asset, Date d) const {
    const auto col = table_.column_of(asset);
    if (!col) return std::nullopt;
    return state_from_count(*col, table_.series(*col).count_through(d));
}

std::optional<HistoryStats> HistoryTracker::stats(const AssetId& asset, Date d) const {
    const auto st = snapshot_at(asset, d);
    if (!st || !st->observed()) return std::nullopt;

    const std::size_t calendar_rows =
        table_.rows_before(add_days(d, 1)) - table_.rows_before(*st->first_seen_date);
    const double coverage = calendar_rows == 0
        ? 0.0
        : 100.0 * static_cast<double>(st->observation_count) / static_cast<double>(calendar_rows);

    return HistoryStats{
        .asset_id         = asset,
        .first_date       = *st->first_seen_date,
        .last_date        = *st->last_seen_date,
        .days_since_first = days_between(*st->first_seen_date, d),
        .rows             = st->observation_count,
        .calendar_rows    = calendar_rows,
        .coverage_pct     = coverage,
    };
}

}  // namespace rebal::eligibility
