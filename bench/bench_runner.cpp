/**
 * @file  bench_runner.cpp
 * @brief Standalone micro-benchmark runner for the rebalancing pipeline.
 *
 * Usage:
 *   ./bench_runner <benchmark_name>
 *
 * Outputs nanoseconds per operation to stdout (the backtest benchmark also
 * reports cache counters on stderr). Returns 0 on success, 1 on unknown
 * benchmark name.
 *
 * Every benchmark runs on a synthetic universe generated from a fixed seed.
 */

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <random>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "rebal/backtest.hpp"
#include "rebal/eligibility.hpp"
#include "rebal/history.hpp"
#include "rebal/preselection.hpp"
#include "rebal/price_table.hpp"
#include "rebal/stats_cache.hpp"

using namespace rebal;
using namespace std::chrono;

// ── Timing harness ────────────────────────────────────────────────────────────

template<typename Fn>
double measure_ns_per_op(Fn&& fn, long min_iters = 10) {
    for (long i = 0; i < std::min(min_iters / 10L, 100L); ++i) fn();

    long iters      = 0;
    double total_ns = 0.0;

    const auto deadline = steady_clock::now() + milliseconds(500);
    do {
        const auto t0 = steady_clock::now();
        fn();
        const auto t1 = steady_clock::now();
        total_ns += static_cast<double>(duration_cast<nanoseconds>(t1 - t0).count());
        ++iters;
    } while (steady_clock::now() < deadline || iters < min_iters);

    return total_ns / static_cast<double>(iters);
}

// ── Synthetic universe ────────────────────────────────────────────────────────

/// `assets` geometric random walks over `days` weekdays. Every fifth asset
/// lists late, every seventh is delisted two thirds of the way through.
core::PriceTable make_universe(std::size_t assets, std::size_t days) {
    std::mt19937_64 rng(42);
    std::normal_distribution<double> shock(0.0003, 0.015);

    std::vector<Date> calendar;
    Date d = make_date(2015, 1, 5);
    while (calendar.size() < days) {
        const std::chrono::weekday wd{d};
        if (wd != std::chrono::Saturday && wd != std::chrono::Sunday) calendar.push_back(d);
        d = add_days(d, 1);
    }

    core::PriceTable table;
    for (std::size_t a = 0; a < assets; ++a) {
        char id[16];
        std::snprintf(id, sizeof(id), "A%04zu", a);
        const std::size_t first = a % 5 == 0 ? days / 4 : 0;
        const std::size_t last  = a % 7 == 0 ? (2 * days) / 3 : days;
        double price = 50.0 + static_cast<double>(a % 50);
        for (std::size_t t = first; t < last; ++t) {
            price *= std::exp(shock(rng));
            table.add(AssetObservation{id, calendar[t], price, 1e6});
        }
    }
    table.finalize();
    return table;
}

// ── Benchmark implementations ─────────────────────────────────────────────────

double bench_eligibility_500() {
    const auto table = make_universe(500, 1000);
    eligibility::HistoryTracker tracker(table);
    const Date check = table.calendar()[800];
    tracker.advance_to(check);
    const eligibility::EligibilityEngine engine(tracker, eligibility::EligibilityConfig{});
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() { sink += engine.eligible_assets(check).size(); });
}

double bench_preselection_500() {
    const auto table = make_universe(500, 1000);
    stats::StatisticsCache cache(1U << 16);
    const preselection::Preselection ps(table, cache,
                                        preselection::PreselectionConfig{
                                            .method = preselection::PreselectionMethod::Combined,
                                            .top_k  = 50});
    std::vector<AssetId> universe(table.assets().begin(), table.assets().end());
    const Date check = table.calendar()[800];
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        cache.clear();
        sink += ps.select(universe, check).size();
    });
}

double bench_backtest_200() {
    const auto table = make_universe(200, 750);
    RunConfig cfg;
    cfg.preselection.top_k  = 20;
    cfg.membership          = membership::MembershipConfig::default_policy();
    cfg.optimizer.kind      = optimizer::OptimizerKind::InverseVolatility;

    stats::CacheCounters counters;
    const double ns = measure_ns_per_op([&]() {
        backtest::BacktestEngine engine(table, cfg);
        const auto result = engine.run();
        counters = engine.cache_counters();
        (void)result;
    }, 3);

    fmt::print(stderr, "cache hits={} misses={} evictions={}\n",
               counters.hits, counters.misses, counters.evictions);
    return ns;
}

// ── Main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::fprintf(stderr,
                     "Usage: %s <eligibility_500|preselection_500|backtest_200>\n", argv[0]);
        return 1;
    }

    const std::string name(argv[1]);
    double ns = 0.0;
    if (name == "eligibility_500") {
        ns = bench_eligibility_500();
    } else if (name == "preselection_500") {
        ns = bench_preselection_500();
    } else if (name == "backtest_200") {
        ns = bench_backtest_200();
    } else {
        std::fprintf(stderr, "Unknown benchmark: %s\n", name.c_str());
        return 1;
    }

    std::printf("%.1f\n", ns);
    return 0;
}
