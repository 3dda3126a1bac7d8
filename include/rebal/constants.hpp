#pragma once

#include <cstddef>

/// @file include/rebal/constants.hpp
/// @brief Default thresholds and numerical tolerances for the rebal system.

namespace rebal::constants {

// ─── Point-in-Time Eligibility ────────────────────────────────────────────────

/// Minimum calendar days between the first observation and the check date.
static constexpr int DEFAULT_MIN_HISTORY_DAYS = 252;

/// Minimum number of observed rows up to (and including) the check date.
static constexpr int DEFAULT_MIN_PRICE_ROWS = 252;

/// Days after the last observation that must stay empty before an asset is
/// considered delisted.
static constexpr int DEFAULT_LOOKFORWARD_DAYS = 30;

// ─── Preselection ─────────────────────────────────────────────────────────────

/// Default factor lookback in trading rows (~1 year of daily data).
static constexpr std::size_t DEFAULT_LOOKBACK = 252;

/// Default number of most-recent rows excluded from the momentum window.
static constexpr std::size_t DEFAULT_SKIP = 1;

/// Default number of valid returns an asset needs inside the lookback window.
static constexpr std::size_t DEFAULT_MIN_PERIODS = 60;

/// Added to realised volatility before inversion in the low-volatility score.
static constexpr double LOW_VOL_EPSILON = 1e-8;

/// Cross-sectional standard deviations below this are treated as zero.
static constexpr double FLAT_STDDEV_THRESHOLD = 1e-8;

/// Tolerance for "combined factor weights sum to 1.0".
static constexpr double FACTOR_WEIGHT_TOLERANCE = 1e-6;

// ─── Statistics Cache ─────────────────────────────────────────────────────────

/// Default number of memoised window statistics kept before LRU eviction.
static constexpr std::size_t DEFAULT_CACHE_CAPACITY = 1U << 16;

// ─── Optimizer / Execution ────────────────────────────────────────────────────

/// Slack allowed when checking that optimizer weights sum to at most 1.
static constexpr double WEIGHT_SUM_TOLERANCE = 1e-9;

/// Smallest pivot accepted when solving against a covariance matrix.
static constexpr double COVARIANCE_SINGULARITY_EPSILON = 1e-12;

/// Fraction of available cash used when buys must be scaled down.
static constexpr double CASH_SCALE_BACK = 0.95;

// ─── Performance Metrics ──────────────────────────────────────────────────────

/// Minimum number of daily returns for Sharpe / Sortino to be reported.
static constexpr std::size_t MIN_RETURN_SERIES_LENGTH = 30;

/// Default annualised risk-free rate (zero: excess-return framing).
static constexpr double DEFAULT_RISK_FREE_RATE = 0.0;

/// Trading days per year.
static constexpr double ANNUALISATION_FACTOR = 252.0;

} // namespace rebal::constants
