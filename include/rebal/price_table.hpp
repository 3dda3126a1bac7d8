#pragma once

/// @file include/rebal/price_table.hpp
/// @brief Canonical per-asset price table with an aligned return matrix.
///
/// # Module: PriceTable
///
/// ## Responsibility
/// Hold every ingested AssetObservation, grouped per asset and sorted by
/// date, and derive:
///   - the global trading calendar (union of all observation dates);
///   - a calendar × asset matrix of simple returns, NaN where the asset did
///     not trade or has no prior price.
///
/// Return at calendar row t for asset a:
///     r_{t,a} = p_{t,a} / p_{prev,a} − 1
/// where p_{prev,a} is the asset's previous observation (which may be several
/// rows earlier if the asset skipped days).
///
/// ## Lifecycle
/// `add()` observations, then `finalize()`. Mutation after finalize bumps
/// `generation()` and requires another `finalize()`; statistics caches key
/// their validity on the generation.
///
/// ## Guarantees
/// - Const member functions are safe to call concurrently
/// - Lookups never throw except the explicitly throwing `at()`

#include "rebal/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rebal::core {

// ─── PricePoint ───────────────────────────────────────────────────────────────

struct PricePoint {
    Date                  date;
    double                price;
    std::optional<double> volume;
};

// ─── AssetSeries ──────────────────────────────────────────────────────────────

/// Date-sorted observations of one asset (one point per date).
class AssetSeries {
public:
    explicit AssetSeries(AssetId id) : id_(std::move(id)) {}

    [[nodiscard]] const AssetId& id() const noexcept { return id_; }
    [[nodiscard]] std::span<const PricePoint> points() const noexcept { return points_; }
    [[nodiscard]] bool empty() const noexcept { return points_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return points_.size(); }

    /// Number of observations with date ≤ `d`.
    [[nodiscard]] std::size_t count_through(Date d) const noexcept;

    /// Most recent observation with date ≤ `d`.
    [[nodiscard]] std::optional<PricePoint> last_through(Date d) const noexcept;

    /// First observation with date strictly after `d`.
    [[nodiscard]] std::optional<PricePoint> first_after(Date d) const noexcept;

    /// Price observed exactly on `d`.
    [[nodiscard]] std::optional<double> price_on(Date d) const noexcept;

private:
    friend class PriceTable;

    AssetId                 id_;
    std::vector<PricePoint> points_;
};

// ─── PriceTable ───────────────────────────────────────────────────────────────

class PriceTable {
public:
    PriceTable() = default;

    /// Append one observation. Duplicate (asset, date) pairs keep the last
    /// value written. Invalidates derived data until `finalize()`.
    ///
    /// # Returns
    /// `false` (observation ignored) if the price is non-finite or ≤ 0, or the
    /// volume is present and negative / non-finite.
    bool add(const AssetObservation& obs);

    /// Sort series, build the calendar and the return matrix.
    void finalize();

    [[nodiscard]] bool finalized() const noexcept { return finalized_; }

    /// Incremented on every mutation; lets caches detect stale entries.
    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }

    // ── Assets ───────────────────────────────────────────────────────────────

    /// Asset identifiers in ascending order.
    [[nodiscard]] std::span<const AssetId> assets() const noexcept { return asset_ids_; }

    [[nodiscard]] bool contains(const AssetId& asset) const noexcept;

    /// Series for `asset`.
    /// # Throws
    /// `DataGapError` if the asset has never been observed.
    [[nodiscard]] const AssetSeries& at(const AssetId& asset) const;

    /// Series at return-matrix column `column`. Precondition: finalized and
    /// `column < assets().size()`.
    [[nodiscard]] const AssetSeries& series(std::size_t column) const noexcept {
        return series_[column];
    }

    /// Column index of `asset` in the return matrix.
    [[nodiscard]] std::optional<std::size_t> column_of(const AssetId& asset) const noexcept;

    // ── Calendar ─────────────────────────────────────────────────────────────

    /// Ascending union of all observation dates.
    [[nodiscard]] std::span<const Date> calendar() const noexcept { return calendar_; }

    /// Number of calendar rows with date strictly before `d`
    /// (equivalently: index of the first row on or after `d`).
    [[nodiscard]] std::size_t rows_before(Date d) const noexcept;

    /// Last date in the table, if any.
    [[nodiscard]] std::optional<Date> last_date() const noexcept;

    // ── Returns ──────────────────────────────────────────────────────────────

    /// Full calendar × asset return matrix (NaN where undefined).
    [[nodiscard]] const ReturnMatrix& returns() const noexcept { return returns_; }

    /// Returns of one asset over calendar rows [first_row, first_row + count).
    /// Out-of-range requests are clipped to the matrix.
    [[nodiscard]] Eigen::VectorXd
    return_window(std::size_t column, std::size_t first_row, std::size_t count) const;

    /// Returns of several assets over rows [first_row, first_row + count).
    /// Columns follow the order of `columns`.
    [[nodiscard]] ReturnMatrix
    return_block(std::span<const std::size_t> columns,
                 std::size_t first_row, std::size_t count) const;

    // ── Prices ───────────────────────────────────────────────────────────────

    /// Price of `asset` observed exactly on `d`.
    [[nodiscard]] std::optional<double> price_on(const AssetId& asset, Date d) const noexcept;

    /// Latest price of `asset` on or before `d` (mark-to-market helper).
    [[nodiscard]] std::optional<double> price_through(const AssetId& asset, Date d) const noexcept;

private:
    std::vector<AssetSeries>                     series_;
    std::unordered_map<AssetId, std::size_t>     index_;
    std::vector<AssetId>                         asset_ids_;
    std::vector<Date>                            calendar_;
    ReturnMatrix                                 returns_;
    std::uint64_t                                generation_ = 0;
    bool                                         finalized_  = false;
};

}  // namespace rebal::core
