/// @file src/core/price_table.cpp
/// @brief PriceTable — per-asset series, trading calendar and return matrix.

#include "rebal/price_table.hpp"
#include "rebal/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace rebal::core {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

[[nodiscard]] bool before(const PricePoint& p, Date d) noexcept { return p.date < d; }

}  // namespace

// ─── AssetSeries ──────────────────────────────────────────────────────────────

std::size_t AssetSeries::count_through(Date d) const noexcept {
    const auto it = std::upper_bound(
        points_.begin(), points_.end(), d,
        [](Date lhs, const PricePoint& rhs) { return lhs < rhs.date; });
    return static_cast<std::size_t>(it - points_.begin());
}

std::optional<PricePoint> AssetSeries::last_through(Date d) const noexcept {
    const std::size_t n = count_through(d);
    if (n == 0) return std::nullopt;
    return points_[n - 1];
}

std::optional<PricePoint> AssetSeries::first_after(Date d) const noexcept {
    const std::size_t n = count_through(d);
    if (n >= points_.size()) return std::nullopt;
    return points_[n];
}

std::optional<double> AssetSeries::price_on(Date d) const noexcept {
    const auto it = std::lower_bound(points_.begin(), points_.end(), d, before);
    if (it == points_.end() || it->date != d) return std::nullopt;
    return it->price;
}

// ─── PriceTable::add ──────────────────────────────────────────────────────────

bool PriceTable::add(const AssetObservation& obs) {
    if (!std::isfinite(obs.price) || obs.price <= 0.0) return false;
    if (obs.volume && (!std::isfinite(*obs.volume) || *obs.volume < 0.0)) return false;
    if (obs.asset_id.empty()) return false;

    auto [it, inserted] = index_.try_emplace(obs.asset_id, series_.size());
    if (inserted) {
        series_.emplace_back(obs.asset_id);
    }
    series_[it->second].points_.push_back(
        PricePoint{.date = obs.date, .price = obs.price, .volume = obs.volume});

    finalized_ = false;
    ++generation_;
    return true;
}

// ─── PriceTable::finalize ─────────────────────────────────────────────────────

void PriceTable::finalize() {
    // ── Step 1: order assets by identifier, points by date ───────────────────
    std::sort(series_.begin(), series_.end(),
              [](const AssetSeries& a, const AssetSeries& b) { return a.id_ < b.id_; });

    index_.clear();
    asset_ids_.clear();
    asset_ids_.reserve(series_.size());

    std::vector<Date> all_dates;
    for (std::size_t i = 0; i < series_.size(); ++i) {
        auto& pts = series_[i].points_;
        // Stable sort keeps insertion order among equal dates so the
        // last-written duplicate survives the dedup below.
        std::stable_sort(pts.begin(), pts.end(),
                         [](const PricePoint& a, const PricePoint& b) { return a.date < b.date; });
        std::vector<PricePoint> unique;
        unique.reserve(pts.size());
        for (const auto& p : pts) {
            if (!unique.empty() && unique.back().date == p.date) {
                unique.back() = p;
            } else {
                unique.push_back(p);
            }
        }
        pts = std::move(unique);

        index_.emplace(series_[i].id_, i);
        asset_ids_.push_back(series_[i].id_);
        for (const auto& p : pts) all_dates.push_back(p.date);
    }

    // ── Step 2: trading calendar ─────────────────────────────────────────────
    std::sort(all_dates.begin(), all_dates.end());
    all_dates.erase(std::unique(all_dates.begin(), all_dates.end()), all_dates.end());
    calendar_ = std::move(all_dates);

    // ── Step 3: calendar × asset simple returns ──────────────────────────────
    const auto rows = static_cast<Eigen::Index>(calendar_.size());
    const auto cols = static_cast<Eigen::Index>(series_.size());
    returns_ = ReturnMatrix::Constant(rows, cols, NaN);

    for (std::size_t c = 0; c < series_.size(); ++c) {
        const auto& pts = series_[c].points_;
        for (std::size_t k = 1; k < pts.size(); ++k) {
            const std::size_t row = rows_before(pts[k].date);
            returns_(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(c)) =
                pts[k].price / pts[k - 1].price - 1.0;
        }
    }

    finalized_ = true;
}

// ─── Lookups ──────────────────────────────────────────────────────────────────

bool PriceTable::contains(const AssetId& asset) const noexcept {
    return index_.find(asset) != index_.end();
}

const AssetSeries& PriceTable::at(const AssetId& asset) const {
    const auto it = index_.find(asset);
    if (it == index_.end()) {
        throw DataGapError(asset);
    }
    return series_[it->second];
}

std::optional<std::size_t> PriceTable::column_of(const AssetId& asset) const noexcept {
    if (!finalized_) return std::nullopt;
    const auto it = index_.find(asset);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

std::size_t PriceTable::rows_before(Date d) const noexcept {
    const auto it = std::lower_bound(calendar_.begin(), calendar_.end(), d);
    return static_cast<std::size_t>(it - calendar_.begin());
}

std::optional<Date> PriceTable::last_date() const noexcept {
    if (calendar_.empty()) return std::nullopt;
    return calendar_.back();
}

// ─── Return windows ───────────────────────────────────────────────────────────

Eigen::VectorXd PriceTable::return_window(std::size_t column,
                                          std::size_t first_row,
                                          std::size_t count) const {
    const auto rows = static_cast<std::size_t>(returns_.rows());
    if (column >= static_cast<std::size_t>(returns_.cols()) || first_row >= rows) {
        return Eigen::VectorXd{};
    }
    const std::size_t n = std::min(count, rows - first_row);
    return returns_.col(static_cast<Eigen::Index>(column))
        .segment(static_cast<Eigen::Index>(first_row), static_cast<Eigen::Index>(n));
}

ReturnMatrix PriceTable::return_block(std::span<const std::size_t> columns,
                                      std::size_t first_row,
                                      std::size_t count) const {
    const auto rows = static_cast<std::size_t>(returns_.rows());
    const std::size_t n = first_row >= rows ? 0 : std::min(count, rows - first_row);

    ReturnMatrix block(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(columns.size()));
    for (std::size_t j = 0; j < columns.size(); ++j) {
        if (columns[j] >= static_cast<std::size_t>(returns_.cols())) {
            block.col(static_cast<Eigen::Index>(j)).setConstant(NaN);
            continue;
        }
        block.col(static_cast<Eigen::Index>(j)) =
            returns_.col(static_cast<Eigen::Index>(columns[j]))
                .segment(static_cast<Eigen::Index>(first_row), static_cast<Eigen::Index>(n));
    }
    return block;
}

// ─── Prices ───────────────────────────────────────────────────────────────────

std::optional<double> PriceTable::price_on(const AssetId& asset, Date d) const noexcept {
    const auto it = index_.find(asset);
    if (it == index_.end()) return std::nullopt;
    return series_[it->second].price_on(d);
}

std::optional<double> PriceTable::price_through(const AssetId& asset, Date d) const noexcept {
    const auto it = index_.find(asset);
    if (it == index_.end()) return std::nullopt;
    const auto p = series_[it->second].last_through(d);
    if (!p) return std::nullopt;
    return p->price;
}

}  // namespace rebal::core
