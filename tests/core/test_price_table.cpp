#include <gtest/gtest.h>
#include "rebal/errors.hpp"
#include "rebal/price_table.hpp"
#include "fixtures.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace rebal;
using namespace rebal::core;
using rebal::testing::add_path;
using rebal::testing::day;

// ─── add ──────────────────────────────────────────────────────────────────────

TEST(PriceTable_Add, RejectsNonPositiveAndNonFinitePrices) {
    PriceTable t;
    EXPECT_FALSE(t.add({"A", day(0), 0.0, std::nullopt}));
    EXPECT_FALSE(t.add({"A", day(0), -1.0, std::nullopt}));
    EXPECT_FALSE(t.add({"A", day(0), std::numeric_limits<double>::quiet_NaN(), std::nullopt}));
    EXPECT_FALSE(t.add({"A", day(0), std::numeric_limits<double>::infinity(), std::nullopt}));
    EXPECT_FALSE(t.add({"A", day(0), 10.0, -5.0}));
    EXPECT_FALSE(t.add({"", day(0), 10.0, std::nullopt}));
    EXPECT_TRUE(t.add({"A", day(0), 10.0, std::nullopt}));
}

TEST(PriceTable_Add, MutationBumpsGenerationAndUnfinalizes) {
    PriceTable t;
    add_path(t, "A", 0, {10.0, 11.0});
    t.finalize();
    const auto g = t.generation();
    EXPECT_TRUE(t.finalized());

    t.add({"A", day(2), 12.0, std::nullopt});
    EXPECT_FALSE(t.finalized());
    EXPECT_GT(t.generation(), g);
    EXPECT_FALSE(t.column_of("A").has_value());
}

// ─── finalize ─────────────────────────────────────────────────────────────────

TEST(PriceTable_Finalize, AssetsSortedById) {
    PriceTable t;
    add_path(t, "ZZZ", 0, {1.0});
    add_path(t, "AAA", 0, {1.0});
    add_path(t, "MMM", 0, {1.0});
    t.finalize();
    ASSERT_EQ(t.assets().size(), 3u);
    EXPECT_EQ(t.assets()[0], "AAA");
    EXPECT_EQ(t.assets()[1], "MMM");
    EXPECT_EQ(t.assets()[2], "ZZZ");
    EXPECT_EQ(*t.column_of("MMM"), 1u);
}

TEST(PriceTable_Finalize, OutOfOrderRowsSorted_DuplicateKeepsLastWritten) {
    PriceTable t;
    t.add({"A", day(2), 12.0, std::nullopt});
    t.add({"A", day(0), 10.0, std::nullopt});
    t.add({"A", day(1), 11.0, std::nullopt});
    t.add({"A", day(1), 11.5, std::nullopt});
    t.finalize();

    const auto pts = t.at("A").points();
    ASSERT_EQ(pts.size(), 3u);
    EXPECT_EQ(pts[0].date, day(0));
    EXPECT_DOUBLE_EQ(pts[1].price, 11.5);
    EXPECT_EQ(pts[2].date, day(2));
}

TEST(PriceTable_Finalize, CalendarIsUnionOfObservationDates) {
    PriceTable t;
    add_path(t, "A", 0, {1.0, 1.0, 1.0});
    add_path(t, "B", 5, {1.0, 1.0});
    t.finalize();
    const auto cal = t.calendar();
    ASSERT_EQ(cal.size(), 5u);
    EXPECT_EQ(cal.front(), day(0));
    EXPECT_EQ(cal.back(), day(6));
    EXPECT_TRUE(t.last_date() == day(6));
}

TEST(PriceTable_Finalize, ReturnsAtObservationRow_NaNElsewhere) {
    PriceTable t;
    add_path(t, "A", 0, {100.0, 110.0, 99.0});
    // B trades on days 0 and 2 only: its day-2 return spans the gap.
    t.add({"B", day(0), 50.0, std::nullopt});
    t.add({"B", day(2), 55.0, std::nullopt});
    t.finalize();

    const auto& r = t.returns();
    ASSERT_EQ(r.rows(), 3);
    ASSERT_EQ(r.cols(), 2);
    EXPECT_TRUE(std::isnan(r(0, 0)));
    EXPECT_NEAR(r(1, 0), 0.10, 1e-12);
    EXPECT_NEAR(r(2, 0), -0.10, 1e-12);
    EXPECT_TRUE(std::isnan(r(0, 1)));
    EXPECT_TRUE(std::isnan(r(1, 1)));
    EXPECT_NEAR(r(2, 1), 0.10, 1e-12);
}

// ─── Lookups ──────────────────────────────────────────────────────────────────

TEST(PriceTable_Lookup, UnknownAsset_AtThrowsDataGap) {
    PriceTable t;
    add_path(t, "A", 0, {1.0});
    t.finalize();
    EXPECT_THROW((void)t.at("MISSING"), DataGapError);
    EXPECT_FALSE(t.contains("MISSING"));
    EXPECT_FALSE(t.price_on("MISSING", day(0)).has_value());
}

TEST(PriceTable_Lookup, RowsBefore_IsStrictlyBefore) {
    PriceTable t;
    add_path(t, "A", 0, {1.0, 1.0, 1.0, 1.0});
    t.finalize();
    EXPECT_EQ(t.rows_before(day(0)), 0u);
    EXPECT_EQ(t.rows_before(day(2)), 2u);
    EXPECT_EQ(t.rows_before(day(100)), 4u);
}

TEST(PriceTable_Lookup, PriceThrough_UsesLastKnownPrice) {
    PriceTable t;
    t.add({"A", day(0), 10.0, std::nullopt});
    t.add({"A", day(3), 13.0, std::nullopt});
    add_path(t, "B", 0, {1.0, 1.0, 1.0, 1.0, 1.0});
    t.finalize();

    EXPECT_FALSE(t.price_on("A", day(1)).has_value());
    EXPECT_DOUBLE_EQ(*t.price_through("A", day(1)), 10.0);
    EXPECT_DOUBLE_EQ(*t.price_through("A", day(4)), 13.0);
    EXPECT_FALSE(t.price_through("A", add_days(day(0), -1)).has_value());
}

TEST(PriceTable_Series, CountLastFirstAfter) {
    PriceTable t;
    for (int d : {0, 2, 4, 6}) t.add({"A", day(d), 1.0 + d, std::nullopt});
    t.finalize();
    const auto& s = t.at("A");

    EXPECT_EQ(s.count_through(day(3)), 2u);
    EXPECT_EQ(s.last_through(day(3))->date, day(2));
    EXPECT_EQ(s.first_after(day(4))->date, day(6));
    EXPECT_FALSE(s.first_after(day(6)).has_value());
    EXPECT_FALSE(s.last_through(add_days(day(0), -1)).has_value());
}

// ─── Windows ──────────────────────────────────────────────────────────────────

TEST(PriceTable_Window, ReturnBlockFollowsColumnOrder_ClipsToMatrix) {
    PriceTable t;
    add_path(t, "A", 0, {1.0, 2.0, 4.0});
    add_path(t, "B", 0, {1.0, 1.5, 1.5});
    t.finalize();

    const std::vector<std::size_t> cols{1, 0};
    const auto block = t.return_block(cols, 1, 10);
    ASSERT_EQ(block.rows(), 2);
    ASSERT_EQ(block.cols(), 2);
    EXPECT_NEAR(block(0, 0), 0.5, 1e-12);
    EXPECT_NEAR(block(0, 1), 1.0, 1e-12);
    EXPECT_NEAR(block(1, 1), 1.0, 1e-12);

    EXPECT_EQ(t.return_window(0, 5, 3).size(), 0);
}
