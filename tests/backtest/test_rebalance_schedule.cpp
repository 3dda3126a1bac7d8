#include <gtest/gtest.h>
#include "rebal/schedule.hpp"

using namespace rebal;
using namespace rebal::backtest;

TEST(RebalanceSchedule_Parse, Names) {
    EXPECT_TRUE(parse_frequency("monthly") == RebalanceFrequency::Monthly);
    EXPECT_TRUE(parse_frequency("annual") == RebalanceFrequency::Annual);
    EXPECT_FALSE(parse_frequency("hourly").has_value());
    EXPECT_EQ(to_string(RebalanceFrequency::Quarterly), "quarterly");
    EXPECT_EQ(to_string(RebalanceTrigger::Forced), "forced");
}

TEST(RebalanceSchedule_Due, NeverOnOrBeforeLast) {
    const Date d = make_date(2023, 5, 10);
    for (auto f : {RebalanceFrequency::Daily, RebalanceFrequency::Weekly,
                   RebalanceFrequency::Monthly, RebalanceFrequency::Quarterly,
                   RebalanceFrequency::Annual}) {
        EXPECT_FALSE(is_rebalance_due(f, d, d)) << to_string(f);
        EXPECT_FALSE(is_rebalance_due(f, d, add_days(d, -3))) << to_string(f);
    }
}

TEST(RebalanceSchedule_Due, Daily) {
    const Date d = make_date(2023, 5, 10);
    EXPECT_TRUE(is_rebalance_due(RebalanceFrequency::Daily, d, add_days(d, 1)));
}

TEST(RebalanceSchedule_Due, WeeklyNeedsSevenDays) {
    const Date d = make_date(2023, 5, 10);
    EXPECT_FALSE(is_rebalance_due(RebalanceFrequency::Weekly, d, add_days(d, 6)));
    EXPECT_TRUE(is_rebalance_due(RebalanceFrequency::Weekly, d, add_days(d, 7)));
}

TEST(RebalanceSchedule_Due, MonthlyOnCalendarMonthChange) {
    EXPECT_FALSE(is_rebalance_due(RebalanceFrequency::Monthly, make_date(2023, 5, 1),
                                  make_date(2023, 5, 31)));
    EXPECT_TRUE(is_rebalance_due(RebalanceFrequency::Monthly, make_date(2023, 5, 31),
                                 make_date(2023, 6, 1)));
    EXPECT_TRUE(is_rebalance_due(RebalanceFrequency::Monthly, make_date(2022, 12, 30),
                                 make_date(2023, 1, 2)));
}

TEST(RebalanceSchedule_Due, QuarterlyThreeMonthsApart) {
    EXPECT_FALSE(is_rebalance_due(RebalanceFrequency::Quarterly, make_date(2023, 1, 31),
                                  make_date(2023, 3, 31)));
    EXPECT_TRUE(is_rebalance_due(RebalanceFrequency::Quarterly, make_date(2023, 1, 31),
                                 make_date(2023, 4, 3)));
    EXPECT_TRUE(is_rebalance_due(RebalanceFrequency::Quarterly, make_date(2022, 11, 15),
                                 make_date(2023, 2, 1)));
}

TEST(RebalanceSchedule_Due, AnnualOnYearChange) {
    EXPECT_FALSE(is_rebalance_due(RebalanceFrequency::Annual, make_date(2023, 1, 2),
                                  make_date(2023, 12, 29)));
    EXPECT_TRUE(is_rebalance_due(RebalanceFrequency::Annual, make_date(2023, 12, 29),
                                 make_date(2024, 1, 2)));
}
