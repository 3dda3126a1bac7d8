/// @file src/backtest/backtest_engine.cpp
/// @brief BacktestEngine: the incremental rebalancing loop.

#include "rebal/backtest.hpp"
#include "rebal/errors.hpp"
#include "rebal/logging.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <set>
#include <utility>

namespace rebal::backtest {

namespace {

[[nodiscard]] RunConfig validated(RunConfig config) {
    config.validate();
    return config;
}

[[nodiscard]] std::vector<AssetId> keys_of(const membership::HoldingBook& book) {
    std::vector<AssetId> out;
    out.reserve(book.size());
    for (const auto& [asset, rec] : book) out.push_back(asset);
    return out;
}

}  // namespace

std::string_view to_string(RebalanceStatus status) noexcept {
    switch (status) {
        case RebalanceStatus::Completed:            return "completed";
        case RebalanceStatus::DegradedNoEligible:   return "degraded_no_eligible";
        case RebalanceStatus::DegradedOptimization: return "degraded_optimization";
        case RebalanceStatus::Failed:               return "failed";
    }
    return "unknown";
}

std::string RebalanceEvent::to_string() const {
    return fmt::format(
        "{} [{}|{}] eligible={} ranked={} held {}->{} +[{}] -[{}] turnover={:.3f} "
        "trades={} costs={:.2f} value {:.2f}->{:.2f}{}",
        format_date(date), backtest::to_string(trigger), backtest::to_string(status),
        eligible_count, ranked_count, holdings_before.size(), holdings_after.size(),
        fmt::join(added, ","), fmt::join(removed, ","), turnover, trades.size(), costs,
        pre_value, post_value, message.empty() ? std::string{} : " (" + message + ")");
}

// ─── Construction ─────────────────────────────────────────────────────────────

BacktestEngine::BacktestEngine(const core::PriceTable&               table,
                               RunConfig                             config,
                               std::unique_ptr<optimizer::Optimizer> optimizer)
    : table_(table)
    , config_(validated(std::move(config)))
    , optimizer_(optimizer ? std::move(optimizer)
                           : optimizer::make_optimizer(config_.optimizer.kind))
    , cache_(config_.cache_capacity)
    , history_(table_)
    , eligibility_(history_, config_.eligibility)
    , preselection_(table_, cache_, config_.preselection)
    , policy_(config_.membership)
    , costs_(config_.costs) {
    for (const Date d : table_.calendar()) {
        if (config_.backtest.start_date && d < *config_.backtest.start_date) continue;
        if (config_.backtest.end_date && d > *config_.backtest.end_date) break;
        days_.push_back(d);
    }
    state_.cash = config_.backtest.initial_capital;

    REBAL_LOG_INFO("backtest: {} assets, {} trading days; {}",
                   table_.assets().size(), days_.size(), config_.describe());
}

// ─── Control ──────────────────────────────────────────────────────────────────

std::optional<Date> BacktestEngine::next_date() const noexcept {
    if (finished()) return std::nullopt;
    return days_[cursor_];
}

std::optional<Date> BacktestEngine::step() {
    if (finished()) return std::nullopt;

    const Date today = days_[cursor_];
    history_.advance_to(today);
    equity_.push_back(EquityPoint{today, mark_to_market(today)});

    const bool has_min_history =
        cursor_ + 1 >= static_cast<std::size_t>(config_.backtest.min_history_periods);
    const bool forced    = has_min_history && events_.empty();
    const bool scheduled = has_min_history && !events_.empty() &&
                           is_rebalance_due(config_.backtest.frequency, events_.back().date, today);

    if (forced || scheduled) {
        events_.push_back(
            rebalance(today, forced ? RebalanceTrigger::Forced : RebalanceTrigger::Scheduled));
    }

    ++cursor_;
    return today;
}

void BacktestEngine::run_until(Date d) {
    while (!finished() && days_[cursor_] <= d) {
        step();
    }
}

BacktestResult BacktestEngine::run() {
    while (!finished()) {
        step();
    }

    const auto counters = cache_.counters();
    REBAL_LOG_INFO("backtest finished: {} rebalances, cache hits={} misses={} evictions={}",
                   events_.size(), counters.hits, counters.misses, counters.evictions);

    return BacktestResult{.events       = events_,
                          .final_state  = state_,
                          .equity_curve = equity_,
                          .metrics      = metrics()};
}

PerformanceMetrics BacktestEngine::metrics() const {
    std::vector<double> equity;
    equity.reserve(equity_.size());
    for (const auto& p : equity_) equity.push_back(p.equity);

    std::vector<double> turnovers;
    double total_costs = 0.0;
    for (const auto& e : events_) {
        if (e.status == RebalanceStatus::Failed) continue;
        turnovers.push_back(e.turnover);
        total_costs += e.costs;
    }
    return PerformanceCalculator::summarize(equity, turnovers, total_costs);
}

double BacktestEngine::mark_to_market(Date d) const {
    double value = state_.cash;
    for (const auto& [asset, shares] : state_.shares) {
        if (const auto px = table_.price_through(asset, d)) {
            value += static_cast<double>(shares) * *px;
        }
    }
    return value;
}

// ─── Rebalance ────────────────────────────────────────────────────────────────

RebalanceEvent BacktestEngine::rebalance(Date d, RebalanceTrigger trigger) {
    RebalanceEvent event;
    event.date            = d;
    event.trigger         = trigger;
    event.holdings_before = keys_of(state_.holdings);
    event.pre_value       = mark_to_market(d);
    event.cash_before     = state_.cash;

    try {
        rebalance_step(d, event);
    } catch (const std::exception& e) {
        // rebalance_step commits only after every fallible stage, so the
        // portfolio is still the previous one here.
        event.status         = RebalanceStatus::Failed;
        event.message        = e.what();
        event.holdings_after = event.holdings_before;
        event.added.clear();
        event.removed.clear();
        event.liquidated.clear();
        event.skips.clear();
        event.trades.clear();
        event.membership_turnover = 0.0;
        event.costs          = 0.0;
        event.turnover       = 0.0;
        event.post_value     = event.pre_value;
        event.cash_after     = state_.cash;
        REBAL_LOG_ERROR("rebalance {} failed: {}", format_date(d), e.what());
        return event;
    }

    if (event.status == RebalanceStatus::Completed) {
        REBAL_LOG_INFO("rebalance {}", event.to_string());
    } else {
        REBAL_LOG_WARN("rebalance {}", event.to_string());
    }
    return event;
}

void BacktestEngine::rebalance_step(Date d, RebalanceEvent& event) {
    const std::size_t threads = config_.worker_threads;

    // ── eligibility-check ────────────────────────────────────────────────────
    const auto eligible = eligibility_.eligible_assets(d, threads);
    event.eligible_count = eligible.size();
    if (eligible.empty()) {
        event.status         = RebalanceStatus::DegradedNoEligible;
        event.message        = "no eligible assets; holding prior portfolio";
        event.holdings_after = event.holdings_before;
        event.post_value     = event.pre_value;
        event.cash_after     = state_.cash;
        return;
    }

    // ── preselect ────────────────────────────────────────────────────────────
    const auto ranked = preselection_.rank(eligible, d, threads);
    event.ranked_count = ranked.size();

    // ── membership-apply ─────────────────────────────────────────────────────
    // Ineligible holdings (e.g. delisted) are forced out unless the holding
    // period protects them, and their slots are refilled in the same step.
    const std::set<AssetId> eligible_set(eligible.begin(), eligible.end());
    std::vector<AssetId> ineligible;
    for (const auto& [asset, rec] : state_.holdings) {
        if (!eligible_set.contains(asset)) ineligible.push_back(asset);
    }

    const auto top_k = static_cast<std::size_t>(config_.preselection.top_k);
    const auto decision = policy_.apply(state_.holdings, ranked, top_k, ineligible);

    for (const auto& a : decision.removed) {
        if (std::binary_search(ineligible.begin(), ineligible.end(), a)) {
            event.liquidated.push_back(a);
        }
    }
    if (!event.liquidated.empty()) {
        REBAL_LOG_WARN("{}: liquidating ineligible holdings [{}]",
                       format_date(d), fmt::join(event.liquidated, ","));
    }

    event.added               = decision.added;
    event.removed             = decision.removed;
    event.skips               = decision.skips;
    event.membership_turnover = decision.turnover;

    // ── optimize ─────────────────────────────────────────────────────────────
    const auto& names = decision.next_holdings;
    std::vector<std::size_t> columns;
    columns.reserve(names.size());
    for (const auto& a : names) columns.push_back(*table_.column_of(a));

    const std::size_t end      = table_.rows_before(d);
    const auto        lookback = static_cast<std::size_t>(config_.backtest.lookback_periods);
    const std::size_t first    = end > lookback ? end - lookback : 0;
    const ReturnMatrix window  = table_.return_block(columns, first, end - first);

    const auto& constraints = config_.optimizer.constraints;
    WeightVector weights;
    try {
        weights = optimizer_->optimize(window, constraints);
        if (weights.size() != static_cast<Eigen::Index>(names.size()) ||
            !optimizer::weights_valid(weights, constraints)) {
            throw OptimizationInfeasible(
                fmt::format("{} returned an invalid weight vector", optimizer_->name()));
        }
    } catch (const OptimizationInfeasible& e) {
        weights        = optimizer::equal_weights(static_cast<Eigen::Index>(names.size()),
                                                  constraints.max_weight);
        event.status   = RebalanceStatus::DegradedOptimization;
        event.message  = fmt::format("equal-weight fallback: {}", e.what());
    }

    // ── execute-trades ───────────────────────────────────────────────────────
    std::map<AssetId, double> prices;
    for (const auto& [asset, sh] : state_.shares) {
        if (const auto px = table_.price_through(asset, d)) prices[asset] = *px;
    }
    for (const auto& a : names) {
        if (const auto px = table_.price_through(a, d)) prices[a] = *px;
    }

    const double pre_value  = event.pre_value;
    const double investable = pre_value * (1.0 - config_.backtest.cash_reserve_pct);

    std::map<AssetId, std::int64_t> target;
    std::map<AssetId, double>       target_weights;
    for (std::size_t i = 0; i < names.size(); ++i) {
        const auto px = prices.find(names[i]);
        const double w = weights[static_cast<Eigen::Index>(i)];
        target_weights[names[i]] = w;
        if (px == prices.end()) continue;
        target[names[i]] = static_cast<std::int64_t>(std::floor(investable * w / px->second));
    }

    std::vector<Trade> sells, buys;
    std::set<AssetId> universe;
    for (const auto& [a, s] : state_.shares) universe.insert(a);
    for (const auto& [a, s] : target) universe.insert(a);
    for (const auto& a : universe) {
        const auto px = prices.find(a);
        if (px == prices.end()) continue;  // no price yet: cannot trade
        const std::int64_t have = state_.shares.contains(a) ? state_.shares.at(a) : 0;
        const std::int64_t want = target.contains(a) ? target.at(a) : 0;
        if (have == want) continue;
        Trade t{.asset_id = a, .shares = want - have, .price = px->second, .cost = 0.0};
        (t.shares > 0 ? buys : sells).push_back(std::move(t));
    }

    const auto price_cost = [this](Trade& t) {
        t.cost = costs_.cost(static_cast<double>(t.shares), t.price).value_or(0.0);
    };

    auto cash   = state_.cash;
    auto shares = state_.shares;

    // A partial trim whose proceeds do not cover its cost is skipped; exits
    // always execute.
    for (auto& t : sells) price_cost(t);
    std::erase_if(sells, [&](const Trade& t) {
        const bool closing = !target.contains(t.asset_id) || target.at(t.asset_id) == 0;
        return !closing && static_cast<double>(-t.shares) * t.price <= t.cost;
    });
    for (const auto& t : sells) {
        cash += static_cast<double>(-t.shares) * t.price - t.cost;
    }

    const auto buy_total = [&buys] {
        double total = 0.0;
        for (const auto& t : buys) total += static_cast<double>(t.shares) * t.price + t.cost;
        return total;
    };
    for (auto& t : buys) price_cost(t);
    if (const double total = buy_total(); total > cash && total > 0.0) {
        const double scale = std::max(0.0, cash) * constants::CASH_SCALE_BACK / total;
        for (auto& t : buys) {
            t.shares = static_cast<std::int64_t>(std::floor(static_cast<double>(t.shares) * scale));
            price_cost(t);
        }
        std::erase_if(buys, [](const Trade& t) { return t.shares == 0; });
    }
    // Minimum commissions do not shrink with the scale; drop the smallest
    // target weights (ties: last identifier) until the buys are funded.
    while (!buys.empty() && buy_total() > cash) {
        const auto worst = std::min_element(
            buys.begin(), buys.end(), [&](const Trade& a, const Trade& b) {
                const double wa = target_weights.at(a.asset_id);
                const double wb = target_weights.at(b.asset_id);
                return wa != wb ? wa < wb : a.asset_id > b.asset_id;
            });
        REBAL_LOG_DEBUG("{}: dropping unfunded buy of {} x{}", format_date(d),
                        worst->asset_id, worst->shares);
        buys.erase(worst);
    }
    for (const auto& t : buys) {
        cash -= static_cast<double>(t.shares) * t.price + t.cost;
    }

    double total_cost = 0.0;
    for (auto* side : {&sells, &buys}) {
        for (auto& t : *side) {
            shares[t.asset_id] += t.shares;
            total_cost += t.cost;
            event.trades.push_back(std::move(t));
        }
    }
    std::erase_if(shares, [](const auto& kv) { return kv.second == 0; });

    // ── record-event (commit) ────────────────────────────────────────────────
    const auto value_of = [&](const std::map<AssetId, std::int64_t>& pos, double c) {
        double v = c;
        for (const auto& [a, s] : pos) {
            const auto px = prices.find(a);
            if (px != prices.end()) v += static_cast<double>(s) * px->second;
        }
        return v;
    };
    const double post_value = value_of(shares, cash);

    double turnover = 0.0;
    if (pre_value > 0.0 && post_value > 0.0) {
        std::set<AssetId> all;
        for (const auto& [a, s] : state_.shares) all.insert(a);
        for (const auto& [a, s] : shares) all.insert(a);
        for (const auto& a : all) {
            const auto px = prices.find(a);
            if (px == prices.end()) continue;
            const double before = state_.shares.contains(a) ? static_cast<double>(state_.shares.at(a)) : 0.0;
            const double after  = shares.contains(a) ? static_cast<double>(shares.at(a)) : 0.0;
            turnover += std::abs(after * px->second / post_value - before * px->second / pre_value);
        }
        turnover *= 0.5;
    }

    membership::MembershipPolicy::commit(state_.holdings, decision, d, ranked);
    state_.shares         = std::move(shares);
    state_.cash           = cash;
    state_.target_weights = std::move(target_weights);

    event.holdings_after = keys_of(state_.holdings);
    event.turnover       = turnover;
    event.costs          = total_cost;
    event.post_value     = post_value;
    event.cash_after     = cash;
}

}  // namespace rebal::backtest
