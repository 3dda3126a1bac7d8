#pragma once

/// @file include/rebal/types.hpp
/// @brief Shared primitive types for the rebal point-in-time rebalancing
///        simulator.
///
/// Every module includes this file. It defines the calendar date type, asset
/// identifiers, the atomic observation row and the Eigen aliases used for
/// return windows.

#include <Eigen/Dense>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rebal {

// ─── Identifiers & Calendar ───────────────────────────────────────────────────

/// Asset identifier (ticker, ISIN, ...). Ordering of identifiers is the
/// deterministic tie-break used everywhere ranks are compared.
using AssetId = std::string;

/// A calendar day. Arithmetic between two dates yields whole days.
using Date = std::chrono::sys_days;

/// Signed number of calendar days from `from` to `to`.
[[nodiscard]] inline std::int64_t days_between(Date from, Date to) noexcept {
    return static_cast<std::int64_t>((to - from).count());
}

/// `d` shifted by `n` calendar days (n may be negative).
[[nodiscard]] inline Date add_days(Date d, std::int64_t n) noexcept {
    return d + std::chrono::days{n};
}

/// Parse an ISO `YYYY-MM-DD` date.
///
/// # Returns
/// `nullopt` on any malformed input or an invalid calendar date (2023-02-30).
[[nodiscard]] std::optional<Date> parse_date(std::string_view text) noexcept;

/// Format a date as ISO `YYYY-MM-DD`.
[[nodiscard]] std::string format_date(Date d);

/// Build a date from year/month/day. Precondition: the triple is valid.
[[nodiscard]] Date make_date(int year, unsigned month, unsigned day) noexcept;

// ─── Observation ──────────────────────────────────────────────────────────────

/// One atomic input row. Immutable once ingested.
struct AssetObservation {
    AssetId               asset_id;
    Date                  date;
    double                price;   ///< Closing price, strictly positive
    std::optional<double> volume;  ///< Traded volume when the source has it
};

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Return window: rows = trading days (oldest first), columns = assets.
/// Missing observations are NaN.
using ReturnMatrix = Eigen::MatrixXd;

/// Portfolio weight vector aligned with the columns of a ReturnMatrix.
using WeightVector = Eigen::VectorXd;

} // namespace rebal
