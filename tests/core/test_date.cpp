#include <gtest/gtest.h>
#include "rebal/types.hpp"

using namespace rebal;

// ─── parse_date ───────────────────────────────────────────────────────────────

TEST(Date_Parse, IsoDate_RoundTripsThroughFormat) {
    const auto d = parse_date("2023-03-15");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(format_date(*d), "2023-03-15");
    EXPECT_EQ(*d, make_date(2023, 3, 15));
}

TEST(Date_Parse, TrailingTimeComponent_Ignored) {
    EXPECT_TRUE(parse_date("2023-01-31 00:00:00") == make_date(2023, 1, 31));
    EXPECT_TRUE(parse_date("2023-01-31T16:00:00Z") == make_date(2023, 1, 31));
}

TEST(Date_Parse, SurroundingWhitespace_Tolerated) {
    EXPECT_TRUE(parse_date("  2021-07-04\r") == make_date(2021, 7, 4));
}

TEST(Date_Parse, InvalidCalendarDate_Nullopt) {
    EXPECT_FALSE(parse_date("2023-02-30").has_value());
    EXPECT_FALSE(parse_date("2023-13-01").has_value());
}

TEST(Date_Parse, LeapDay_Accepted) {
    EXPECT_TRUE(parse_date("2024-02-29").has_value());
    EXPECT_FALSE(parse_date("2023-02-29").has_value());
}

TEST(Date_Parse, Malformed_Nullopt) {
    EXPECT_FALSE(parse_date("").has_value());
    EXPECT_FALSE(parse_date("2023/01/01").has_value());
    EXPECT_FALSE(parse_date("23-01-01").has_value());
    EXPECT_FALSE(parse_date("-023-01-01").has_value());
    EXPECT_FALSE(parse_date("2023-1-011").has_value());
    EXPECT_FALSE(parse_date("abcd-ef-gh").has_value());
}

// ─── Arithmetic ───────────────────────────────────────────────────────────────

TEST(Date_Arithmetic, DaysBetween_Signed) {
    const Date a = make_date(2020, 1, 1);
    const Date b = make_date(2020, 12, 31);
    EXPECT_EQ(days_between(a, b), 365);  // leap year
    EXPECT_EQ(days_between(b, a), -365);
    EXPECT_EQ(days_between(a, a), 0);
}

TEST(Date_Arithmetic, AddDays_CrossesMonthAndYear) {
    EXPECT_EQ(add_days(make_date(2021, 12, 31), 1), make_date(2022, 1, 1));
    EXPECT_EQ(add_days(make_date(2022, 3, 1), -1), make_date(2022, 2, 28));
}
