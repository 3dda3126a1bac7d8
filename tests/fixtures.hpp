#pragma once

/// @file tests/fixtures.hpp
/// @brief Synthetic price tables and ranking helpers shared by the tests.
///
/// Days are consecutive calendar days from 2020-01-01, so a day index equals
/// the number of calendar days since the origin.

#include "rebal/membership.hpp"
#include "rebal/preselection.hpp"
#include "rebal/price_table.hpp"
#include "rebal/types.hpp"

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace rebal::testing {

[[nodiscard]] inline Date origin() { return make_date(2020, 1, 1); }

[[nodiscard]] inline Date day(int n) { return add_days(origin(), n); }

/// One observation per day for `prices.size()` consecutive days.
inline void add_path(core::PriceTable& table, const AssetId& id, int first_day,
                     const std::vector<double>& prices) {
    for (std::size_t i = 0; i < prices.size(); ++i) {
        table.add(AssetObservation{id, day(first_day + static_cast<int>(i)), prices[i], 1000.0});
    }
}

/// `count` consecutive days compounding at `daily_return`.
inline void add_geometric(core::PriceTable& table, const AssetId& id, int first_day,
                          int count, double start, double daily_return) {
    double p = start;
    for (int i = 0; i < count; ++i) {
        table.add(AssetObservation{id, day(first_day + i), p, 1000.0});
        p *= 1.0 + daily_return;
    }
}

/// `count` consecutive days of a seeded log-normal walk.
inline void add_random_walk(core::PriceTable& table, const AssetId& id, int first_day,
                            int count, double start, double drift, double vol,
                            std::uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> shock(drift, vol);
    double p = start;
    for (int i = 0; i < count; ++i) {
        table.add(AssetObservation{id, day(first_day + i), p, 1000.0});
        p *= std::exp(shock(rng));
    }
}

/// Walks of different drift for `n` assets named A00, A01, ... all covering
/// days [0, days). Asset k drifts by `k * 1e-4` per day.
[[nodiscard]] inline core::PriceTable make_universe(int n, int days, std::uint64_t seed = 7) {
    core::PriceTable table;
    for (int k = 0; k < n; ++k) {
        const AssetId id = (k < 10 ? "A0" : "A") + std::to_string(k);
        add_random_walk(table, id, 0, days, 100.0, 1e-4 * k, 0.01,
                        seed + static_cast<std::uint64_t>(k));
    }
    table.finalize();
    return table;
}

/// Candidates ranked in the given order (first = rank 1).
[[nodiscard]] inline std::vector<preselection::RankedCandidate>
ranked(std::initializer_list<const char*> order) {
    std::vector<preselection::RankedCandidate> out;
    std::size_t r = 1;
    for (const char* id : order) {
        out.push_back(preselection::RankedCandidate{
            .asset_id = id, .score = 1.0 / static_cast<double>(r), .rank = r});
        ++r;
    }
    return out;
}

/// Holding book from (asset, periods_held) pairs.
[[nodiscard]] inline membership::HoldingBook
holdings(std::initializer_list<std::pair<const char*, int>> items) {
    membership::HoldingBook book;
    for (const auto& [id, held] : items) {
        book.emplace(id, membership::HoldingRecord{
                             .asset_id = id, .entry_date = origin(), .periods_held = held,
                             .last_rank = std::nullopt});
    }
    return book;
}

}  // namespace rebal::testing
