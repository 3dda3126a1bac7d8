/**
 * @file  fuzz_price_loader.cpp
 * @brief libFuzzer target for PriceLoader::parse_csv_string.
 *
 * Build:
 *   cmake -DREBAL_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_price_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_price_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. If a table is returned:
 *      a. it is finalized, with a strictly increasing calendar
 *      b. every stored price is finite and > 0
 *      c. every series is strictly increasing in date
 *      d. rows_accepted ≥ number of distinct stored points
 *   3. A history tracker and eligibility engine built over the table never
 *      throw when advanced to the last calendar date.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "rebal/eligibility.hpp"
#include "rebal/history.hpp"
#include "rebal/price_loader.hpp"

using namespace rebal;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    const auto loaded = core::PriceLoader::parse_csv_string(input);
    if (!loaded) return 0;

    const auto& table = loaded->table;
    assert(table.finalized());

    // Invariant 2a
    const auto calendar = table.calendar();
    for (std::size_t i = 1; i < calendar.size(); ++i) {
        assert(calendar[i - 1] < calendar[i]);
    }

    // Invariants 2b, 2c, 2d
    std::size_t stored = 0;
    for (std::size_t c = 0; c < table.assets().size(); ++c) {
        const auto points = table.series(c).points();
        for (std::size_t i = 0; i < points.size(); ++i) {
            assert(std::isfinite(points[i].price));
            assert(points[i].price > 0.0);
            if (i > 0) assert(points[i - 1].date < points[i].date);
        }
        stored += points.size();
    }
    assert(loaded->rows_accepted >= stored);

    // Invariant 3
    if (!calendar.empty()) {
        eligibility::HistoryTracker tracker(table);
        tracker.advance_to(calendar.back());
        const eligibility::EligibilityEngine engine(tracker, eligibility::EligibilityConfig{});
        const auto eligible = engine.eligible_assets(calendar.back());
        assert(eligible.size() <= table.assets().size());
    }

    return 0;
}
