#pragma once

/// @file include/rebal/schedule.hpp
/// @brief Calendar rules deciding when a scheduled rebalance is due.

#include "rebal/types.hpp"

#include <optional>
#include <string_view>

namespace rebal::backtest {

enum class RebalanceFrequency {
    Daily,      ///< Every trading day
    Weekly,     ///< ≥ 7 calendar days since the last rebalance
    Monthly,    ///< Calendar month changed
    Quarterly,  ///< ≥ 3 calendar months apart
    Annual,     ///< Calendar year changed
};

enum class RebalanceTrigger {
    Forced,     ///< First rebalance once enough history exists
    Scheduled,
};

[[nodiscard]] std::string_view to_string(RebalanceFrequency f) noexcept;
[[nodiscard]] std::string_view to_string(RebalanceTrigger t) noexcept;

/// Parse `daily | weekly | monthly | quarterly | annual`.
[[nodiscard]] std::optional<RebalanceFrequency> parse_frequency(std::string_view name) noexcept;

/// `true` if a rebalance is due on `today` given the previous one on `last`.
[[nodiscard]] bool is_rebalance_due(RebalanceFrequency frequency, Date last, Date today) noexcept;

}  // namespace rebal::backtest
