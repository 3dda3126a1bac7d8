#pragma once

/// @file include/rebal/metrics.hpp
/// @brief Performance statistics of a simulated equity curve.
///
/// # Module: PerformanceCalculator
///
/// ## Metrics
///   - Sharpe ratio:          (mean − r_f) / σ · √ann
///   - Sortino ratio:         (mean − r_f) / σ_down · √ann
///   - Maximum drawdown:      max peak-to-trough loss of the compounded curve
///   - Annualised return:     (1 + total)^(ann / n) − 1
///   - Annualised volatility: σ · √ann
///   - Calmar ratio:          annualised return / max drawdown
///   - Win rate:              share of strictly positive daily returns
///
/// ## Guarantees
/// - All fallible operations return `std::optional`
/// - Returns must be finite; NaN/Inf inputs produce `std::nullopt`

#include "rebal/constants.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace rebal::backtest {

/// Summary of one backtest run.
struct PerformanceMetrics {
    double                total_return          = 0.0;
    double                annualised_return     = 0.0;
    double                annualised_volatility = 0.0;
    std::optional<double> sharpe_ratio;
    std::optional<double> sortino_ratio;
    double                max_drawdown          = 0.0;
    std::optional<double> calmar_ratio;
    double                win_rate              = 0.0;
    double                average_turnover      = 0.0;
    double                total_costs           = 0.0;
    std::size_t           num_rebalances        = 0;
    std::size_t           num_days              = 0;

    /// Multi-line human-readable summary.
    [[nodiscard]] std::string to_string() const;
};

/// Stateless utility for computing financial performance metrics.
///
/// All methods are static and operate on `std::span<const double>` for
/// zero-copy access to any contiguous container.
class PerformanceCalculator {
public:
    /// Annualised Sharpe ratio.
    ///
    /// # Returns
    /// `nullopt` if the series is shorter than MIN_RETURN_SERIES_LENGTH,
    /// σ = 0, or any NaN/Inf.
    [[nodiscard]] static std::optional<double>
    sharpe(std::span<const double> returns,
           double risk_free_rate = constants::DEFAULT_RISK_FREE_RATE,
           double annualisation  = constants::ANNUALISATION_FACTOR) noexcept;

    /// Annualised Sortino ratio (downside-deviation denominator).
    ///
    /// # Returns
    /// `nullopt` if the series is too short, downside-vol is zero, or any NaN/Inf.
    [[nodiscard]] static std::optional<double>
    sortino(std::span<const double> returns,
            double risk_free_rate = constants::DEFAULT_RISK_FREE_RATE,
            double annualisation  = constants::ANNUALISATION_FACTOR) noexcept;

    /// Maximum drawdown in [0, 1] of the curve compounded from `returns`.
    [[nodiscard]] static std::optional<double>
    max_drawdown(std::span<const double> returns) noexcept;

    [[nodiscard]] static std::optional<double>
    annualised_return(std::span<const double> returns,
                      double annualisation = constants::ANNUALISATION_FACTOR) noexcept;

    /// # Returns
    /// `nullopt` with fewer than two returns or any NaN/Inf.
    [[nodiscard]] static std::optional<double>
    annualised_volatility(std::span<const double> returns,
                          double annualisation = constants::ANNUALISATION_FACTOR) noexcept;

    /// # Returns
    /// `nullopt` when the drawdown is zero.
    [[nodiscard]] static std::optional<double>
    calmar(std::span<const double> returns,
           double annualisation = constants::ANNUALISATION_FACTOR) noexcept;

    [[nodiscard]] static std::optional<double>
    win_rate(std::span<const double> returns) noexcept;

    /// Daily simple returns of an equity curve. Non-positive equity values end
    /// the series.
    [[nodiscard]] static std::vector<double> returns_from_equity(std::span<const double> equity);

    /// Full summary of an equity curve plus per-rebalance turnover and costs.
    [[nodiscard]] static PerformanceMetrics
    summarize(std::span<const double> equity,
              std::span<const double> turnovers,
              double                  total_costs,
              double risk_free_rate = constants::DEFAULT_RISK_FREE_RATE,
              double annualisation  = constants::ANNUALISATION_FACTOR);

private:
    /// Mean of a span.  Unchecked — caller must ensure non-empty, finite.
    static double mean(std::span<const double> v) noexcept;
    /// Sample std-dev of a span.  Unchecked — caller ensures length ≥ 2.
    static double stddev(std::span<const double> v, double mean_val) noexcept;
    /// Downside std-dev relative to `threshold`.
    static double downside_stddev(std::span<const double> v, double threshold) noexcept;
};

}  // namespace rebal::backtest
