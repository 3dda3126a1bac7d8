#pragma once

/// @file include/rebal/run_config.hpp
/// @brief Aggregate configuration of a backtest run.
///
/// Every sub-config validates itself; `RunConfig::validate()` runs them all
/// and throws the first `ConfigurationError`, naming the offending field.
/// Validation happens once at setup, never mid-run.

#include "rebal/constants.hpp"
#include "rebal/costs.hpp"
#include "rebal/eligibility.hpp"
#include "rebal/membership.hpp"
#include "rebal/optimizer.hpp"
#include "rebal/preselection.hpp"
#include "rebal/schedule.hpp"
#include "rebal/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace rebal {

namespace backtest {

struct BacktestConfig {
    std::optional<Date> start_date;  ///< Defaults to the first calendar date
    std::optional<Date> end_date;    ///< Defaults to the last calendar date
    double              initial_capital     = 100'000.0;
    RebalanceFrequency  frequency           = RebalanceFrequency::Monthly;
    int                 min_history_periods = 1;    ///< Trading days simulated before the first rebalance
    int                 lookback_periods    = 252;  ///< Return rows handed to the optimizer
    double              cash_reserve_pct    = 0.01;

    void validate() const;
};

}  // namespace backtest

struct RunConfig {
    eligibility::EligibilityConfig   eligibility;
    preselection::PreselectionConfig preselection;
    membership::MembershipConfig     membership;
    backtest::BacktestConfig         backtest;
    optimizer::OptimizerConfig       optimizer;
    backtest::CostConfig             costs;
    std::size_t                      cache_capacity = constants::DEFAULT_CACHE_CAPACITY;
    std::size_t                      worker_threads = 1;

    /// # Throws
    /// `ConfigurationError` for the first invalid field.
    void validate() const;

    /// One-line summary for the run log.
    [[nodiscard]] std::string describe() const;
};

}  // namespace rebal
