#pragma once

/// @file include/rebal/history.hpp
/// @brief Incremental per-asset observation accounting.
///
/// # Module: HistoryTracker
///
/// ## Responsibility
/// Maintain, for every asset in a PriceTable, the observation summary as of
/// the tracker's current date: first/last seen dates, cumulative row count
/// and the start of the most recent gap.
///
/// ## Two access paths
/// - `advance_to(d)` moves per-asset cursors forward in O(new rows); state is
///   never edited retroactively and advancing to an earlier date is a no-op.
/// - `snapshot_at(asset, d)` is a pure O(log n) query for any date. Both paths
///   agree for the tracker's current date.
///
/// A gap is two consecutive observations further apart than `gap_days`
/// calendar days; `last_gap_start` is the observation date preceding it.

#include "rebal/price_table.hpp"
#include "rebal/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace rebal::eligibility {

// ─── AssetHistoryState ────────────────────────────────────────────────────────

struct AssetHistoryState {
    std::optional<Date> first_seen_date;
    std::optional<Date> last_seen_date;
    std::size_t         observation_count = 0;
    std::optional<Date> last_gap_start;

    [[nodiscard]] bool observed() const noexcept { return observation_count > 0; }

    bool operator==(const AssetHistoryState&) const = default;
};

// ─── HistoryStats ─────────────────────────────────────────────────────────────

/// Diagnostic summary of one asset's history as of a date.
struct HistoryStats {
    AssetId      asset_id;
    Date         first_date;
    Date         last_date;
    std::int64_t days_since_first;  ///< check date − first observation
    std::size_t  rows;              ///< Observations ≤ check date
    std::size_t  calendar_rows;     ///< Trading-calendar rows in [first, check]
    double       coverage_pct;      ///< 100 · rows / calendar_rows
};

// ─── HistoryTracker ───────────────────────────────────────────────────────────

class HistoryTracker {
public:
    /// Default gap threshold: covers a long weekend plus a holiday.
    static constexpr std::int64_t DEFAULT_GAP_DAYS = 5;

    /// The table must be finalized and must outlive the tracker.
    explicit HistoryTracker(const core::PriceTable& table,
                            std::int64_t gap_days = DEFAULT_GAP_DAYS);

    /// Consume all observations dated ≤ `d`. No-op if `d` is not after the
    /// current date.
    void advance_to(Date d);

    /// Date the tracker has been advanced to, if any.
    [[nodiscard]] std::optional<Date> current_date() const noexcept { return current_; }

    /// Incremental state of `asset` at the current date.
    /// `nullopt` for assets absent from the table.
    [[nodiscard]] std::optional<AssetHistoryState> state(const AssetId& asset) const;

    /// State of `asset` using only observations dated ≤ `d`.
    [[nodiscard]] std::optional<AssetHistoryState> snapshot_at(const AssetId& asset, Date d) const;

    /// Diagnostics for `asset` at `d`; `nullopt` if it has no observation ≤ `d`.
    [[nodiscard]] std::optional<HistoryStats> stats(const AssetId& asset, Date d) const;

    /// Rewind to the empty state.
    void reset();

    [[nodiscard]] const core::PriceTable& table() const noexcept { return table_; }

private:
    struct Track {
        std::size_t       cursor = 0;
        AssetHistoryState state;
    };

    [[nodiscard]] AssetHistoryState state_from_count(std::size_t column, std::size_t n) const;

    const core::PriceTable&                      table_;
    std::int64_t                                 gap_days_;
    std::vector<Track>                           tracks_;
    /// Per asset, per observation k: start of the latest gap ending at or
    /// before observation k.
    std::vector<std::vector<std::optional<Date>>> gap_index_;
    std::optional<Date>                          current_;
};

}  // namespace rebal::eligibility
