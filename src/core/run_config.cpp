/// @file src/core/run_config.cpp
/// @brief RunConfig validation and summary.

#include "rebal/run_config.hpp"
#include "rebal/errors.hpp"

#include <fmt/format.h>

#include <cmath>

namespace rebal {

void backtest::BacktestConfig::validate() const {
    if (!std::isfinite(initial_capital) || initial_capital <= 0.0) {
        throw ConfigurationError("backtest.initial_capital", "must be > 0");
    }
    if (start_date && end_date && *end_date < *start_date) {
        throw ConfigurationError("backtest.end_date", "must not precede start_date");
    }
    if (min_history_periods < 1) {
        throw ConfigurationError("backtest.min_history_periods", "must be >= 1");
    }
    if (lookback_periods < 2) {
        throw ConfigurationError("backtest.lookback_periods", "must be >= 2");
    }
    if (!(cash_reserve_pct >= 0.0 && cash_reserve_pct < 1.0)) {
        throw ConfigurationError("backtest.cash_reserve_pct", "must be in [0, 1)");
    }
}

void RunConfig::validate() const {
    eligibility.validate();
    preselection.validate();
    membership.validate();
    backtest.validate();
    optimizer.validate();
    costs.validate();
    if (cache_capacity == 0) {
        throw ConfigurationError("cache_capacity", "must be >= 1");
    }
    if (worker_threads == 0) {
        throw ConfigurationError("worker_threads", "must be >= 1");
    }
}

std::string RunConfig::describe() const {
    const auto opt_int = [](const std::optional<int>& v) {
        return v ? fmt::format("{}", *v) : std::string("-");
    };
    return fmt::format(
        "method={} top_k={} lookback={} skip={} min_periods={} | "
        "min_history_days={} min_price_rows={} lookforward={} | "
        "membership={} buffer={} min_hold={} max_turnover={} max_new={} max_removed={} | "
        "optimizer={} frequency={} threads={}",
        preselection::to_string(preselection.method), preselection.top_k, preselection.lookback,
        preselection.skip, preselection.min_periods,
        eligibility.min_history_days, eligibility.min_price_rows, eligibility.lookforward_days,
        membership.enabled ? "on" : "off", opt_int(membership.buffer_rank),
        membership.min_holding_periods,
        membership.max_turnover ? fmt::format("{:.2f}", *membership.max_turnover) : std::string("-"),
        opt_int(membership.max_new_assets), opt_int(membership.max_removed_assets),
        optimizer::to_string(optimizer.kind), backtest::to_string(backtest.frequency),
        worker_threads);
}

}  // namespace rebal
