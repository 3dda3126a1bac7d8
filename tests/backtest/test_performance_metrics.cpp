#include <gtest/gtest.h>
#include "rebal/constants.hpp"
#include "rebal/metrics.hpp"

#include <cmath>
#include <limits>
#include <span>
#include <vector>

using namespace rebal;
using namespace rebal::backtest;
using namespace rebal::constants;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static std::vector<double> make_constant_returns(std::size_t n, double val) {
    return std::vector<double>(n, val);
}

static std::vector<double> make_returns_with_mean_stddev(
        double target_mean, double target_stddev, std::size_t n) {
    // Alternating series: half at (mean + stddev), half at (mean - stddev)
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i) {
        v[i] = (i % 2 == 0) ? target_mean + target_stddev
                              : target_mean - target_stddev;
    }
    return v;
}

// ─── Sharpe ───────────────────────────────────────────────────────────────────

TEST(PerformanceCalculator_Sharpe, ConstantReturns_ZeroVariance_Nullopt) {
    auto returns = make_constant_returns(50, 0.01);
    EXPECT_FALSE(PerformanceCalculator::sharpe(returns, 0.0, 1.0).has_value());
}

TEST(PerformanceCalculator_Sharpe, KnownValues_CorrectAnnualised) {
    // (0.001 / 0.01) · √252 ≈ 1.5874
    auto returns = make_returns_with_mean_stddev(0.001, 0.01, 500);
    auto result  = PerformanceCalculator::sharpe(returns, 0.0, ANNUALISATION_FACTOR);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(*result, 0.001 / 0.01 * std::sqrt(252.0), 0.05);
}

TEST(PerformanceCalculator_Sharpe, RiskFreeSubtracted) {
    auto returns = make_returns_with_mean_stddev(0.001, 0.01, 500);
    auto result  = PerformanceCalculator::sharpe(returns, 0.0005, ANNUALISATION_FACTOR);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(*result, 0.0005 / 0.01 * std::sqrt(252.0), 0.05);
}

TEST(PerformanceCalculator_Sharpe, ShorterThanMinimumSeries_Nullopt) {
    EXPECT_FALSE(PerformanceCalculator::sharpe(std::span<const double>{}).has_value());

    auto short_series = make_returns_with_mean_stddev(0.001, 0.01, MIN_RETURN_SERIES_LENGTH - 1);
    EXPECT_FALSE(PerformanceCalculator::sharpe(short_series).has_value());

    auto exact = make_returns_with_mean_stddev(0.001, 0.01, MIN_RETURN_SERIES_LENGTH);
    EXPECT_TRUE(PerformanceCalculator::sharpe(exact).has_value());
}

TEST(PerformanceCalculator_Sharpe, NonFiniteInput_Nullopt) {
    auto returns = make_returns_with_mean_stddev(0.001, 0.01, 60);
    returns[7] = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(PerformanceCalculator::sharpe(returns).has_value());
    returns[7] = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(PerformanceCalculator::sharpe(returns).has_value());
}

TEST(PerformanceCalculator_Sharpe, NegativeMean_NegativeSharpe) {
    auto returns = make_returns_with_mean_stddev(-0.001, 0.01, 500);
    auto result  = PerformanceCalculator::sharpe(returns);
    ASSERT_TRUE(result.has_value());
    EXPECT_LT(*result, 0.0);
}

// ─── Sortino ─────────────────────────────────────────────────────────────────

TEST(PerformanceCalculator_Sortino, NoDownsideReturns_Nullopt) {
    auto returns = make_constant_returns(100, 0.01);
    EXPECT_FALSE(PerformanceCalculator::sortino(returns, 0.0, 1.0).has_value());
}

TEST(PerformanceCalculator_Sortino, PositiveSkew_AtLeastSharpe) {
    std::vector<double> returns;
    for (int i = 0; i < 100; ++i) {
        returns.push_back(i % 10 == 0 ? -0.005 : 0.002);
    }
    auto sh = PerformanceCalculator::sharpe(returns);
    auto so = PerformanceCalculator::sortino(returns);
    ASSERT_TRUE(sh.has_value());
    ASSERT_TRUE(so.has_value());
    EXPECT_GE(std::abs(*so), std::abs(*sh) * 0.95);
}

// ─── Max Drawdown ─────────────────────────────────────────────────────────────

TEST(PerformanceCalculator_MaxDrawdown, EmptyInput_Nullopt) {
    EXPECT_FALSE(PerformanceCalculator::max_drawdown(std::span<const double>{}).has_value());
}

TEST(PerformanceCalculator_MaxDrawdown, MonotonicallyRising_ZeroDrawdown) {
    auto returns = make_constant_returns(100, 0.01);
    auto result  = PerformanceCalculator::max_drawdown(returns);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(*result, 0.0, 1e-15);
}

TEST(PerformanceCalculator_MaxDrawdown, SingleDropThenRecover_KnownMDD) {
    // Equity: 1 → 1.1 → 0.9 → 1.1
    std::vector<double> returns = {
        0.10,
        (0.90 - 1.10) / 1.10,
        (1.10 - 0.90) / 0.90
    };
    auto result = PerformanceCalculator::max_drawdown(returns);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(*result, (1.10 - 0.90) / 1.10, 1e-9);
}

TEST(PerformanceCalculator_MaxDrawdown, AlwaysInUnitInterval) {
    std::vector<double> r;
    for (int i = 0; i < 200; ++i) {
        r.push_back((i % 3 == 0) ? -0.05 : 0.02);
    }
    auto result = PerformanceCalculator::max_drawdown(r);
    ASSERT_TRUE(result.has_value());
    EXPECT_GE(*result, 0.0);
    EXPECT_LE(*result, 1.0);
}

// ─── Annualised figures ───────────────────────────────────────────────────────

TEST(PerformanceCalculator_Annualised, ReturnCompoundsToYear) {
    // 126 days of +0.1 % over a 252-day year: (1.001^126)^2 − 1
    auto returns = make_constant_returns(126, 0.001);
    auto result  = PerformanceCalculator::annualised_return(returns);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(*result, std::pow(1.001, 252.0) - 1.0, 1e-9);
}

TEST(PerformanceCalculator_Annualised, WipedOutCurve_MinusOne) {
    std::vector<double> r = {0.1, -1.0, 0.2};
    EXPECT_DOUBLE_EQ(PerformanceCalculator::annualised_return(r).value_or(0.0), -1.0);
}

TEST(PerformanceCalculator_Annualised, VolatilityScalesWithRootOfYear) {
    auto returns = make_returns_with_mean_stddev(0.0, 0.01, 2);
    // Sample sd of {0.01, −0.01} = √2 · 0.01
    auto result = PerformanceCalculator::annualised_volatility(returns);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(*result, std::sqrt(2.0) * 0.01 * std::sqrt(252.0), 1e-12);

    std::vector<double> one = {0.01};
    EXPECT_FALSE(PerformanceCalculator::annualised_volatility(one).has_value());
}

TEST(PerformanceCalculator_Calmar, UndefinedWithoutDrawdown) {
    auto rising = make_constant_returns(40, 0.001);
    EXPECT_FALSE(PerformanceCalculator::calmar(rising).has_value());

    std::vector<double> r = {0.10, -0.05, 0.02};
    auto c   = PerformanceCalculator::calmar(r);
    auto ann = PerformanceCalculator::annualised_return(r);
    auto mdd = PerformanceCalculator::max_drawdown(r);
    ASSERT_TRUE(c && ann && mdd);
    EXPECT_NEAR(*c, *ann / *mdd, 1e-12);
}

TEST(PerformanceCalculator_WinRate, ShareOfStrictlyPositiveDays) {
    std::vector<double> r = {0.01, 0.0, -0.02, 0.03};
    EXPECT_DOUBLE_EQ(PerformanceCalculator::win_rate(r).value_or(-1.0), 0.5);
    EXPECT_FALSE(PerformanceCalculator::win_rate(std::span<const double>{}).has_value());
}

// ─── Equity curve ─────────────────────────────────────────────────────────────

TEST(PerformanceCalculator_Equity, ReturnsFromEquity) {
    std::vector<double> equity = {100.0, 110.0, 99.0};
    const auto r = PerformanceCalculator::returns_from_equity(equity);
    ASSERT_EQ(r.size(), 2u);
    EXPECT_NEAR(r[0], 0.10, 1e-12);
    EXPECT_NEAR(r[1], -0.10, 1e-12);

    std::vector<double> bust = {100.0, 0.0, 50.0};
    EXPECT_EQ(PerformanceCalculator::returns_from_equity(bust).size(), 1u);
}

TEST(PerformanceCalculator_Summarize, CombinesCurveTurnoverAndCosts) {
    std::vector<double> equity = {1000.0, 1010.0, 1000.0, 1020.0};
    std::vector<double> turnovers = {1.0, 0.2, 0.3};
    const auto m = PerformanceCalculator::summarize(equity, turnovers, 12.5);

    EXPECT_NEAR(m.total_return, 0.02, 1e-12);
    EXPECT_NEAR(m.average_turnover, 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(m.total_costs, 12.5);
    EXPECT_EQ(m.num_rebalances, 3u);
    EXPECT_EQ(m.num_days, 4u);
    EXPECT_NEAR(m.max_drawdown, 10.0 / 1010.0, 1e-12);
    EXPECT_NEAR(m.win_rate, 2.0 / 3.0, 1e-12);
    EXPECT_FALSE(m.sharpe_ratio.has_value());  // fewer than 30 returns

    const auto text = m.to_string();
    EXPECT_NE(text.find("Rebalances"), std::string::npos);
    EXPECT_NE(text.find("n/a"), std::string::npos);
}

TEST(PerformanceCalculator_Summarize, EmptyCurve_AllZero) {
    const auto m = PerformanceCalculator::summarize(std::span<const double>{},
                                                    std::span<const double>{}, 0.0);
    EXPECT_DOUBLE_EQ(m.total_return, 0.0);
    EXPECT_EQ(m.num_days, 0u);
    EXPECT_FALSE(m.calmar_ratio.has_value());
}
