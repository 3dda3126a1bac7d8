#pragma once

/// @file include/rebal/errors.hpp
/// @brief Exception taxonomy.
///
/// Exceptions are reserved for the two boundaries where the caller must act:
/// configuration (fail fast before a run starts) and the optimizer plug-in
/// (recovered by the rebalance loop). Everything inside a rebalance step
/// reports failure through `std::optional` or reason codes instead.
///
/// Conflicting membership limits never raise: they are resolved by the
/// precedence hold-period > removal cap > turnover cap.

#include "rebal/types.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace rebal {

/// Invalid configuration detected at setup. Never thrown mid-run.
class ConfigurationError : public std::invalid_argument {
public:
    ConfigurationError(std::string field, const std::string& reason)
        : std::invalid_argument(field + ": " + reason)
        , field_(std::move(field)) {}

    /// Dotted name of the offending field, e.g. `preselection.skip`.
    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

/// Asset missing from the price index where a caller demanded it.
/// Only thrown by explicitly throwing accessors (`PriceTable::at`); the
/// rebalance path degrades missing data to ineligibility instead.
class DataGapError : public std::out_of_range {
public:
    explicit DataGapError(const AssetId& asset)
        : std::out_of_range("no observations for asset '" + asset + "'")
        , asset_(asset) {}

    [[nodiscard]] const AssetId& asset() const noexcept { return asset_; }

private:
    AssetId asset_;
};

/// Raised by an optimizer that cannot produce a feasible weight vector.
class OptimizationInfeasible : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace rebal
