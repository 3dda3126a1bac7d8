#pragma once

/// @file include/rebal/backtest.hpp
/// @brief Incremental point-in-time rebalancing loop.
///
/// # Module: BacktestEngine
///
/// ## Per trading day
/// Advance the history tracker, mark the portfolio to market, and rebalance
/// when due (forced once `min_history_periods` days were simulated, then on
/// the configured frequency).
///
/// ## Per rebalance
///     eligibility → preselection → membership → optimize → execute → record
///
/// - Zero eligible assets: the prior portfolio is kept and a
///   `DegradedNoEligible` event is recorded.
/// - `OptimizationInfeasible` or invalid weights: the candidates are equal
///   weighted and the event is `DegradedOptimization`.
/// - Holdings that are no longer eligible (typically delisted) are forced
///   out through membership unless the minimum holding period protects them;
///   their slots are refilled in the same rebalance.
/// - Buys never overdraw cash: after scaling, unfunded buys are dropped
///   smallest target weight first.
/// - Any other exception fails only that step (`Failed`); the portfolio keeps
///   its last committed state.
///
/// `periods_held` is advanced once per rebalance for every surviving holding,
/// in O(holdings).
///
/// ## Control
/// `step()` processes one trading day, `run_until(d)` every day ≤ d, `run()`
/// the rest. Between calls the PortfolioState is the last committed one.

#include "rebal/eligibility.hpp"
#include "rebal/history.hpp"
#include "rebal/membership.hpp"
#include "rebal/metrics.hpp"
#include "rebal/optimizer.hpp"
#include "rebal/preselection.hpp"
#include "rebal/price_table.hpp"
#include "rebal/run_config.hpp"
#include "rebal/stats_cache.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rebal::backtest {

enum class RebalanceStatus {
    Completed,
    DegradedNoEligible,
    DegradedOptimization,
    Failed,
};

[[nodiscard]] std::string_view to_string(RebalanceStatus status) noexcept;

struct Trade {
    AssetId      asset_id;
    std::int64_t shares;  ///< Positive = buy
    double       price;
    double       cost;
};

/// Immutable record of one rebalance date.
struct RebalanceEvent {
    Date                               date;
    RebalanceTrigger                   trigger = RebalanceTrigger::Scheduled;
    RebalanceStatus                    status  = RebalanceStatus::Completed;
    std::vector<AssetId>               holdings_before;
    std::vector<AssetId>               holdings_after;
    std::vector<AssetId>               added;
    std::vector<AssetId>               removed;
    std::vector<AssetId>               liquidated;  ///< Ineligible holdings forced out
    std::vector<membership::PolicySkip> skips;
    std::size_t                        eligible_count      = 0;
    std::size_t                        ranked_count        = 0;
    double                             membership_turnover = 0.0;
    double                             turnover            = 0.0;  ///< ½ Σ |Δw|
    std::vector<Trade>                 trades;
    double                             costs      = 0.0;
    double                             pre_value  = 0.0;
    double                             post_value = 0.0;
    double                             cash_before = 0.0;
    double                             cash_after  = 0.0;
    std::string                        message;

    [[nodiscard]] std::string to_string() const;
};

/// The single portfolio instance the loop updates in place.
struct PortfolioState {
    membership::HoldingBook          holdings;
    std::map<AssetId, std::int64_t>  shares;
    std::map<AssetId, double>        target_weights;
    double                           cash = 0.0;
};

struct EquityPoint {
    Date   date;
    double equity;
};

struct BacktestResult {
    std::vector<RebalanceEvent> events;
    PortfolioState              final_state;
    std::vector<EquityPoint>    equity_curve;
    PerformanceMetrics          metrics;
};

class BacktestEngine {
public:
    /// `table` must be finalized and outlive the engine. A null `optimizer`
    /// builds the one named in `config.optimizer`.
    ///
    /// # Throws
    /// `ConfigurationError` if `config` is invalid.
    BacktestEngine(const core::PriceTable&               table,
                   RunConfig                             config,
                   std::unique_ptr<optimizer::Optimizer> optimizer = nullptr);

    BacktestEngine(const BacktestEngine&)            = delete;
    BacktestEngine& operator=(const BacktestEngine&) = delete;

    [[nodiscard]] bool finished() const noexcept { return cursor_ >= days_.size(); }

    /// Next trading day to be processed.
    [[nodiscard]] std::optional<Date> next_date() const noexcept;

    /// Process one trading day. Returns the day processed, or `nullopt` when
    /// the run is finished.
    std::optional<Date> step();

    /// Process every remaining trading day dated ≤ `d`.
    void run_until(Date d);

    /// Process the remaining days and summarize.
    BacktestResult run();

    [[nodiscard]] const PortfolioState& portfolio() const noexcept { return state_; }
    [[nodiscard]] const std::vector<RebalanceEvent>& events() const noexcept { return events_; }
    [[nodiscard]] const std::vector<EquityPoint>& equity_curve() const noexcept { return equity_; }

    /// Metrics over the days processed so far.
    [[nodiscard]] PerformanceMetrics metrics() const;

    [[nodiscard]] stats::CacheCounters cache_counters() const { return cache_.counters(); }
    [[nodiscard]] const RunConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] double mark_to_market(Date d) const;
    [[nodiscard]] RebalanceEvent rebalance(Date d, RebalanceTrigger trigger);
    void rebalance_step(Date d, RebalanceEvent& event);

    const core::PriceTable&                 table_;
    RunConfig                               config_;
    std::unique_ptr<optimizer::Optimizer>   optimizer_;
    stats::StatisticsCache                  cache_;
    eligibility::HistoryTracker             history_;
    eligibility::EligibilityEngine          eligibility_;
    preselection::Preselection              preselection_;
    membership::MembershipPolicy            policy_;
    CostModel                               costs_;

    std::vector<Date>                       days_;
    std::size_t                             cursor_ = 0;
    PortfolioState                          state_;
    std::vector<RebalanceEvent>             events_;
    std::vector<EquityPoint>                equity_;
};

}  // namespace rebal::backtest
