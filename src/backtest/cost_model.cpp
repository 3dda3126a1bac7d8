/// @file src/backtest/cost_model.cpp
/// @brief CostModel implementation.

#include "rebal/costs.hpp"
#include "rebal/errors.hpp"

#include <algorithm>
#include <cmath>

namespace rebal::backtest {

void CostConfig::validate() const {
    if (!std::isfinite(commission_pct) || commission_pct < 0.0) {
        throw ConfigurationError("costs.commission_pct", "must be a finite value >= 0");
    }
    if (!std::isfinite(commission_min) || commission_min < 0.0) {
        throw ConfigurationError("costs.commission_min", "must be a finite value >= 0");
    }
    if (!std::isfinite(slippage_bps) || slippage_bps < 0.0) {
        throw ConfigurationError("costs.slippage_bps", "must be a finite value >= 0");
    }
}

CostModel::CostModel(CostConfig config) : config_(config) {
    config_.validate();
}

std::optional<double> CostModel::cost(double shares, double price) const noexcept {
    if (!std::isfinite(shares) || !std::isfinite(price) || price <= 0.0) {
        return std::nullopt;
    }
    if (shares == 0.0) return 0.0;

    const double value      = std::abs(shares) * price;
    const double commission = std::max(value * config_.commission_pct, config_.commission_min);
    const double slippage   = value * config_.slippage_bps / 10'000.0;
    return commission + slippage;
}

}  // namespace rebal::backtest
