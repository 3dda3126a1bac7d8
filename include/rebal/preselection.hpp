#pragma once

/// @file include/rebal/preselection.hpp
/// @brief Factor scoring and deterministic ranking of eligible assets.
///
/// # Module: Preselection
///
/// ## Windows
/// Let `e = rows_before(date)`: only calendar rows `[0, e)` (strictly before
/// `date`) are ever read.
///   - momentum:       rows `[e − lookback, e − skip)`, score `∏(1 + r) − 1`
///   - low volatility: rows `[e − lookback, e)`, score `1 / (σ + 1e-8)`
///     with σ the sample standard deviation
///   - combined:       `w_m · z(momentum) + w_v · z(low_vol)`
/// Windows are clipped at the start of the calendar. Assets with fewer than
/// `min_periods` finite returns in `[e − lookback, e)` are excluded.
///
/// ## Ranking
/// Descending score, ties by ascending identifier; NaN scores are excluded.
/// Ranks are 1-based and form a total order.
///
/// ## Caching
/// Window statistics go through the StatisticsCache, keyed by the exact rows
/// read. `rank()` clears the cache first if the table's generation moved
/// since the previous call; scoring has no other side effect.

#include "rebal/constants.hpp"
#include "rebal/price_table.hpp"
#include "rebal/stats_cache.hpp"
#include "rebal/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rebal::preselection {

enum class PreselectionMethod {
    Momentum,
    LowVolatility,
    Combined,
};

[[nodiscard]] std::string_view to_string(PreselectionMethod method) noexcept;

/// Parse `momentum | low_volatility | combined`.
[[nodiscard]] std::optional<PreselectionMethod> parse_method(std::string_view name) noexcept;

struct PreselectionConfig {
    PreselectionMethod method          = PreselectionMethod::Momentum;
    int                top_k           = 0;  ///< 0 = rank all qualifying assets
    int                lookback        = static_cast<int>(constants::DEFAULT_LOOKBACK);
    int                skip            = static_cast<int>(constants::DEFAULT_SKIP);
    int                min_periods     = static_cast<int>(constants::DEFAULT_MIN_PERIODS);
    double             momentum_weight = 0.5;
    double             low_vol_weight  = 0.5;

    /// # Throws
    /// `ConfigurationError` unless `lookback >= 1`, `0 <= skip < lookback`,
    /// `1 <= min_periods <= lookback`, `top_k >= 0` and the combined weights
    /// sum to 1 within 1e-6.
    void validate() const;
};

struct RankedCandidate {
    AssetId     asset_id;
    double      score;
    std::size_t rank;  ///< 1-based

    bool operator==(const RankedCandidate&) const = default;
};

class Preselection {
public:
    /// `table` and `cache` must outlive the engine.
    ///
    /// # Throws
    /// `ConfigurationError` if `config` is invalid.
    Preselection(const core::PriceTable& table,
                 stats::StatisticsCache& cache,
                 PreselectionConfig      config);

    /// Full ranking of the qualifying subset of `eligible`.
    [[nodiscard]] std::vector<RankedCandidate>
    rank(std::span<const AssetId> eligible, Date date, std::size_t threads = 1) const;

    /// `rank()` truncated to `min(top_k, |qualifying|)`.
    [[nodiscard]] std::vector<RankedCandidate>
    select(std::span<const AssetId> eligible, Date date, std::size_t threads = 1) const;

    /// Momentum score of one asset; `nullopt` if unknown or no finite return
    /// in the window.
    [[nodiscard]] std::optional<double> momentum_score(const AssetId& asset, Date date) const;

    /// Low-volatility score of one asset; `nullopt` if unknown or fewer than
    /// two finite returns in the window.
    [[nodiscard]] std::optional<double> low_volatility_score(const AssetId& asset, Date date) const;

    /// Finite returns of `asset` in the lookback window.
    [[nodiscard]] std::size_t valid_periods(const AssetId& asset, Date date) const;

    [[nodiscard]] const PreselectionConfig& config() const noexcept { return config_; }

private:
    struct Window {
        std::size_t first = 0;
        std::size_t count = 0;
    };

    [[nodiscard]] Window momentum_window(Date date) const noexcept;
    [[nodiscard]] Window lookback_window(Date date) const noexcept;

    [[nodiscard]] double cached(std::size_t column, stats::StatKind kind, Window w) const;

    const core::PriceTable& table_;
    stats::StatisticsCache& cache_;
    PreselectionConfig      config_;
    mutable std::uint64_t   generation_;
};

/// Rank `eligible` by `method` in one call, building a transient engine.
[[nodiscard]] std::vector<RankedCandidate>
select(const core::PriceTable&  table,
       stats::StatisticsCache&  cache,
       std::span<const AssetId> eligible,
       Date                     date,
       PreselectionMethod       method,
       int                      top_k,
       int                      lookback,
       int                      skip,
       double                   momentum_weight = 0.5,
       double                   low_vol_weight  = 0.5,
       int                      min_periods     = 1);

}  // namespace rebal::preselection
