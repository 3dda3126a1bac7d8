#pragma once

/// @file include/rebal/costs.hpp
/// @brief Commission + slippage transaction-cost model.
///
/// For a trade of value V = |shares| · price:
///     commission = max(V · commission_pct, commission_min)
///     slippage   = V · slippage_bps / 10 000
///     cost       = commission + slippage

#include <optional>

namespace rebal::backtest {

struct CostConfig {
    double commission_pct = 0.001;  ///< 0.1 %
    double commission_min = 0.0;
    double slippage_bps   = 5.0;

    /// # Throws
    /// `ConfigurationError` on a negative or non-finite field.
    void validate() const;
};

class CostModel {
public:
    /// # Throws
    /// `ConfigurationError` if `config` is invalid.
    explicit CostModel(CostConfig config);

    /// Cost of trading `shares` (sign ignored) at `price`.
    ///
    /// # Returns
    /// 0 for a zero-share trade; `nullopt` if `price` is non-positive or
    /// either argument is non-finite.
    [[nodiscard]] std::optional<double> cost(double shares, double price) const noexcept;

    [[nodiscard]] const CostConfig& config() const noexcept { return config_; }

private:
    CostConfig config_;
};

}  // namespace rebal::backtest
