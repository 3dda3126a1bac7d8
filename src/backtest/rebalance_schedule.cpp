/// @file src/backtest/rebalance_schedule.cpp
/// @brief Rebalance calendar rules.

#include "rebal/schedule.hpp"

namespace rebal::backtest {

std::string_view to_string(RebalanceFrequency f) noexcept {
    switch (f) {
        case RebalanceFrequency::Daily:     return "daily";
        case RebalanceFrequency::Weekly:    return "weekly";
        case RebalanceFrequency::Monthly:   return "monthly";
        case RebalanceFrequency::Quarterly: return "quarterly";
        case RebalanceFrequency::Annual:    return "annual";
    }
    return "unknown";
}

std::string_view to_string(RebalanceTrigger t) noexcept {
    switch (t) {
        case RebalanceTrigger::Forced:    return "forced";
        case RebalanceTrigger::Scheduled: return "scheduled";
    }
    return "unknown";
}

std::optional<RebalanceFrequency> parse_frequency(std::string_view name) noexcept {
    if (name == "daily")     return RebalanceFrequency::Daily;
    if (name == "weekly")    return RebalanceFrequency::Weekly;
    if (name == "monthly")   return RebalanceFrequency::Monthly;
    if (name == "quarterly") return RebalanceFrequency::Quarterly;
    if (name == "annual")    return RebalanceFrequency::Annual;
    return std::nullopt;
}

bool is_rebalance_due(RebalanceFrequency frequency, Date last, Date today) noexcept {
    if (today <= last) return false;

    const std::chrono::year_month_day a{last};
    const std::chrono::year_month_day b{today};
    const int months_apart =
        (static_cast<int>(b.year()) - static_cast<int>(a.year())) * 12 +
        (static_cast<int>(static_cast<unsigned>(b.month())) -
         static_cast<int>(static_cast<unsigned>(a.month())));

    switch (frequency) {
        case RebalanceFrequency::Daily:     return days_between(last, today) >= 1;
        case RebalanceFrequency::Weekly:    return days_between(last, today) >= 7;
        case RebalanceFrequency::Monthly:   return months_apart != 0;
        case RebalanceFrequency::Quarterly: return months_apart >= 3;
        case RebalanceFrequency::Annual:    return b.year() != a.year();
    }
    return false;
}

}  // namespace rebal::backtest
