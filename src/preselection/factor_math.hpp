#pragma once

/// @file src/preselection/factor_math.hpp
/// @brief NaN-aware window statistics used by factor scoring (internal).
///
/// Every function ignores non-finite entries, which mark rows where the asset
/// did not trade.

#include <Eigen/Dense>

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace rebal::preselection::detail {

/// Number of finite entries.
[[nodiscard]] std::size_t count_finite(const Eigen::Ref<const Eigen::VectorXd>& r) noexcept;

/// ∏(1 + r) − 1 over finite entries; `nullopt` if there are none.
[[nodiscard]] std::optional<double>
compound_return(const Eigen::Ref<const Eigen::VectorXd>& r) noexcept;

/// Sample (n − 1) standard deviation over finite entries; `nullopt` with
/// fewer than two.
[[nodiscard]] std::optional<double>
sample_stddev(const Eigen::Ref<const Eigen::VectorXd>& r) noexcept;

/// Cross-sectional z-scores. Non-finite inputs map to 0; a population with
/// fewer than two finite values or a stddev below `flat_threshold` maps
/// entirely to 0.
[[nodiscard]] std::vector<double> zscores(std::span<const double> values,
                                          double                  flat_threshold);

}  // namespace rebal::preselection::detail
