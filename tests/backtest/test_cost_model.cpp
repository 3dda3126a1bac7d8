#include <gtest/gtest.h>
#include "rebal/costs.hpp"
#include "rebal/errors.hpp"

#include <cmath>
#include <limits>

using namespace rebal;
using namespace rebal::backtest;

TEST(CostModel_Config, NegativeOrNonFiniteRejected) {
    EXPECT_THROW((void)CostModel(CostConfig{.commission_pct = -0.01}), ConfigurationError);
    EXPECT_THROW((void)CostModel(CostConfig{.commission_min = -1.0}), ConfigurationError);
    EXPECT_THROW(
        (void)CostModel(CostConfig{.slippage_bps = std::numeric_limits<double>::infinity()}),
        ConfigurationError);
}

TEST(CostModel_Cost, CommissionPlusSlippage) {
    const CostModel model(CostConfig{});
    // V = 100 · 50 = 5000; 0.1 % = 5; 5 bps = 2.5
    ASSERT_TRUE(model.cost(100.0, 50.0).has_value());
    EXPECT_NEAR(*model.cost(100.0, 50.0), 7.5, 1e-12);
}

TEST(CostModel_Cost, SignOfSharesIgnored) {
    const CostModel model(CostConfig{});
    EXPECT_DOUBLE_EQ(model.cost(-100.0, 50.0).value_or(-1.0),
                     model.cost(100.0, 50.0).value_or(-2.0));
}

TEST(CostModel_Cost, MinimumCommissionFloor) {
    const CostModel model(CostConfig{.commission_pct = 0.001, .commission_min = 1.0,
                                     .slippage_bps = 0.0});
    EXPECT_DOUBLE_EQ(model.cost(1.0, 10.0).value_or(0.0), 1.0);
    EXPECT_DOUBLE_EQ(model.cost(10'000.0, 10.0).value_or(0.0), 100.0);
}

TEST(CostModel_Cost, ZeroSharesCostNothing) {
    const CostModel model(CostConfig{.commission_min = 5.0});
    EXPECT_DOUBLE_EQ(model.cost(0.0, 10.0).value_or(-1.0), 0.0);
}

TEST(CostModel_Cost, InvalidInputsNullopt) {
    const CostModel model(CostConfig{});
    EXPECT_FALSE(model.cost(10.0, 0.0).has_value());
    EXPECT_FALSE(model.cost(10.0, -5.0).has_value());
    EXPECT_FALSE(model.cost(std::numeric_limits<double>::quiet_NaN(), 5.0).has_value());
    EXPECT_FALSE(model.cost(10.0, std::numeric_limits<double>::infinity()).has_value());
}
