/// @file src/backtest/performance_metrics.cpp
/// @brief Implementation of PerformanceCalculator.
///
/// Fallible paths return std::nullopt; no function ever calls abort(),
/// assert(), or throws an exception.

#include "rebal/metrics.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace rebal::backtest {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

/// Return false if any element of `v` is NaN or ±Inf.
[[nodiscard]] bool all_finite(std::span<const double> v) noexcept {
    for (double x : v) {
        if (!std::isfinite(x)) return false;
    }
    return true;
}

[[nodiscard]] std::string fmt_opt(const std::optional<double>& v) {
    return v ? fmt::format("{:.4f}", *v) : std::string("n/a");
}

}  // namespace

// ─── PerformanceCalculator — private statics ──────────────────────────────────

double PerformanceCalculator::mean(std::span<const double> v) noexcept {
    const double sum = std::accumulate(v.begin(), v.end(), 0.0);
    return sum / static_cast<double>(v.size());
}

double PerformanceCalculator::stddev(std::span<const double> v, double mean_val) noexcept {
    // Bessel-corrected (n−1).
    double sq_sum = 0.0;
    for (double x : v) {
        const double d = x - mean_val;
        sq_sum += d * d;
    }
    return std::sqrt(sq_sum / static_cast<double>(v.size() - 1));
}

double PerformanceCalculator::downside_stddev(std::span<const double> v,
                                              double threshold) noexcept {
    // RMS of returns below `threshold`; 0 with fewer than 2 such returns.
    double sq_sum = 0.0;
    std::size_t count = 0;
    for (double x : v) {
        if (x < threshold) {
            const double d = x - threshold;
            sq_sum += d * d;
            ++count;
        }
    }
    if (count < 2) return 0.0;
    return std::sqrt(sq_sum / static_cast<double>(count - 1));
}

// ─── Sharpe / Sortino ─────────────────────────────────────────────────────────

std::optional<double>
PerformanceCalculator::sharpe(std::span<const double> returns,
                              double risk_free_rate,
                              double annualisation) noexcept {
    if (returns.size() < constants::MIN_RETURN_SERIES_LENGTH) return std::nullopt;
    if (!all_finite(returns))                                  return std::nullopt;
    if (!std::isfinite(risk_free_rate))                        return std::nullopt;
    if (annualisation <= 0.0)                                  return std::nullopt;

    const double mu = mean(returns);
    const double sd = stddev(returns, mu);
    if (sd <= 0.0) return std::nullopt;

    return (mu - risk_free_rate) / sd * std::sqrt(annualisation);
}

std::optional<double>
PerformanceCalculator::sortino(std::span<const double> returns,
                               double risk_free_rate,
                               double annualisation) noexcept {
    if (returns.size() < constants::MIN_RETURN_SERIES_LENGTH) return std::nullopt;
    if (!all_finite(returns))                                  return std::nullopt;
    if (!std::isfinite(risk_free_rate))                        return std::nullopt;
    if (annualisation <= 0.0)                                  return std::nullopt;

    const double mu    = mean(returns);
    const double sd_dn = downside_stddev(returns, risk_free_rate);
    if (sd_dn <= 0.0) return std::nullopt;

    return (mu - risk_free_rate) / sd_dn * std::sqrt(annualisation);
}

// ─── Drawdown ─────────────────────────────────────────────────────────────────

std::optional<double>
PerformanceCalculator::max_drawdown(std::span<const double> returns) noexcept {
    if (returns.empty())      return std::nullopt;
    if (!all_finite(returns)) return std::nullopt;

    double equity = 1.0;
    double peak   = 1.0;
    double max_dd = 0.0;

    for (double r : returns) {
        equity *= (1.0 + r);
        if (equity > peak) {
            peak = equity;
        } else {
            max_dd = std::max(max_dd, (peak - equity) / peak);
        }
    }
    return max_dd;
}

// ─── Annualised figures ───────────────────────────────────────────────────────

std::optional<double>
PerformanceCalculator::annualised_return(std::span<const double> returns,
                                         double annualisation) noexcept {
    if (returns.empty() || !all_finite(returns) || annualisation <= 0.0) return std::nullopt;

    double growth = 1.0;
    for (double r : returns) growth *= (1.0 + r);
    if (growth <= 0.0) return -1.0;

    return std::pow(growth, annualisation / static_cast<double>(returns.size())) - 1.0;
}

std::optional<double>
PerformanceCalculator::annualised_volatility(std::span<const double> returns,
                                             double annualisation) noexcept {
    if (returns.size() < 2 || !all_finite(returns) || annualisation <= 0.0) return std::nullopt;
    return stddev(returns, mean(returns)) * std::sqrt(annualisation);
}

std::optional<double>
PerformanceCalculator::calmar(std::span<const double> returns, double annualisation) noexcept {
    const auto ann = annualised_return(returns, annualisation);
    const auto mdd = max_drawdown(returns);
    if (!ann || !mdd || *mdd <= 0.0) return std::nullopt;
    return *ann / *mdd;
}

std::optional<double> PerformanceCalculator::win_rate(std::span<const double> returns) noexcept {
    if (returns.empty() || !all_finite(returns)) return std::nullopt;
    const auto wins = std::count_if(returns.begin(), returns.end(),
                                    [](double r) { return r > 0.0; });
    return static_cast<double>(wins) / static_cast<double>(returns.size());
}

// ─── Equity curve ─────────────────────────────────────────────────────────────

std::vector<double> PerformanceCalculator::returns_from_equity(std::span<const double> equity) {
    std::vector<double> out;
    if (equity.size() < 2) return out;
    out.reserve(equity.size() - 1);
    for (std::size_t i = 1; i < equity.size(); ++i) {
        if (!(equity[i - 1] > 0.0) || !std::isfinite(equity[i])) break;
        out.push_back(equity[i] / equity[i - 1] - 1.0);
    }
    return out;
}

PerformanceMetrics
PerformanceCalculator::summarize(std::span<const double> equity,
                                 std::span<const double> turnovers,
                                 double                  total_costs,
                                 double                  risk_free_rate,
                                 double                  annualisation) {
    PerformanceMetrics m;
    m.num_days       = equity.size();
    m.num_rebalances = turnovers.size();
    m.total_costs    = total_costs;
    if (!turnovers.empty()) {
        m.average_turnover = mean(turnovers);
    }

    const auto returns = returns_from_equity(equity);
    if (equity.size() >= 2 && equity.front() > 0.0) {
        m.total_return = equity.back() / equity.front() - 1.0;
    }

    m.annualised_return     = annualised_return(returns, annualisation).value_or(0.0);
    m.annualised_volatility = annualised_volatility(returns, annualisation).value_or(0.0);
    m.sharpe_ratio          = sharpe(returns, risk_free_rate, annualisation);
    m.sortino_ratio         = sortino(returns, risk_free_rate, annualisation);
    m.max_drawdown          = max_drawdown(returns).value_or(0.0);
    m.calmar_ratio          = calmar(returns, annualisation);
    m.win_rate              = win_rate(returns).value_or(0.0);
    return m;
}

// ─── PerformanceMetrics ───────────────────────────────────────────────────────

std::string PerformanceMetrics::to_string() const {
    return fmt::format(
        "Total return       {:>10.2f} %\n"
        "Annualised return  {:>10.2f} %\n"
        "Annualised vol     {:>10.2f} %\n"
        "Sharpe             {:>10}\n"
        "Sortino            {:>10}\n"
        "Max drawdown       {:>10.2f} %\n"
        "Calmar             {:>10}\n"
        "Win rate           {:>10.2f} %\n"
        "Average turnover   {:>10.4f}\n"
        "Total costs        {:>10.2f}\n"
        "Rebalances         {:>10}\n"
        "Days               {:>10}\n",
        total_return * 100.0, annualised_return * 100.0, annualised_volatility * 100.0,
        fmt_opt(sharpe_ratio), fmt_opt(sortino_ratio), max_drawdown * 100.0,
        fmt_opt(calmar_ratio), win_rate * 100.0, average_turnover, total_costs,
        num_rebalances, num_days);
}

}  // namespace rebal::backtest
