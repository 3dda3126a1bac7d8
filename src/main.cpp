/// @file src/main.cpp
/// @brief rebal CLI entry point.
///
/// Usage:
///   rebal --prices <csv_file> [options]   Run a point-in-time rebalancing backtest
///   rebal --help                          Print usage

#include "rebal/backtest.hpp"
#include "rebal/errors.hpp"
#include "rebal/logging.hpp"
#include "rebal/price_loader.hpp"
#include "rebal/run_config.hpp"

#include <fmt/core.h>
#include <spdlog/common.h>

#include <cstdlib>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  rebal --prices <csv_file> [options]\n"
        "  rebal --help\n"
        "\n"
        "Options:\n"
        "  --start YYYY-MM-DD         First simulated day\n"
        "  --end YYYY-MM-DD           Last simulated day\n"
        "  --capital <x>              Initial capital (default 100000)\n"
        "  --method <name>            momentum | low_volatility | combined\n"
        "  --top-k <n>                Target holdings (0 = every ranked asset)\n"
        "  --lookback <n>             Factor lookback rows (default 252)\n"
        "  --skip <n>                 Rows excluded from momentum (default 1)\n"
        "  --min-periods <n>          Valid returns needed in the lookback (default 60)\n"
        "  --min-history-days <n>     Eligibility: calendar days since first observation\n"
        "  --min-rows <n>             Eligibility: observed rows up to the date\n"
        "  --lookforward <n>          Eligibility: empty days implying delisting\n"
        "  --buffer-rank <n>          Keep holdings ranked within n\n"
        "  --min-hold <n>             Minimum holding periods\n"
        "  --max-turnover <x>         Membership turnover cap in [0, 1]\n"
        "  --max-new <n>              Additions per rebalance\n"
        "  --max-removed <n>          Removals per rebalance\n"
        "  --no-membership            Plain top-k selection\n"
        "  --frequency <name>         daily | weekly | monthly | quarterly | annual\n"
        "  --optimizer <name>         equal_weight | inverse_volatility | min_variance\n"
        "  --max-weight <x>           Per-asset weight cap in (0, 1]\n"
        "  --threads <n>              Worker threads for per-asset work\n"
        "  --log-level <level>        trace | debug | info | warn | error | off\n"
        "  --log-file <path>          Also log to a file\n"
        "\n"
        "CSV format (header required, volume optional):\n"
        "  date,asset,price[,volume]\n"
    );
}

[[nodiscard]] int parse_int(const std::string& flag, const std::string& text) {
    std::size_t used = 0;
    const int v = std::stoi(text, &used);
    if (used != text.size()) {
        throw std::invalid_argument(flag + ": trailing characters in '" + text + "'");
    }
    return v;
}

[[nodiscard]] double parse_double(const std::string& flag, const std::string& text) {
    std::size_t used = 0;
    const double v = std::stod(text, &used);
    if (used != text.size()) {
        throw std::invalid_argument(flag + ": trailing characters in '" + text + "'");
    }
    return v;
}

[[nodiscard]] rebal::Date parse_day(const std::string& flag, const std::string& text) {
    const auto d = rebal::parse_date(text);
    if (!d) throw std::invalid_argument(flag + ": expected YYYY-MM-DD, got '" + text + "'");
    return *d;
}

struct CliOptions {
    std::string                prices;
    rebal::RunConfig           config;
    spdlog::level::level_enum  log_level = spdlog::level::info;
    std::optional<std::string> log_file;
};

/// Parse argv into CliOptions.
///
/// # Throws
/// `std::invalid_argument` / `std::out_of_range` on malformed values.
[[nodiscard]] CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;
    auto& cfg = opts.config;

    for (int i = 1; i < argc; ++i) {
        const std::string flag(argv[i]);
        if (flag == "--no-membership") {
            cfg.membership.enabled = false;
            continue;
        }
        if (i + 1 >= argc) {
            throw std::invalid_argument(flag + ": missing value");
        }
        const std::string value(argv[++i]);

        if (flag == "--prices") {
            opts.prices = value;
        } else if (flag == "--start") {
            cfg.backtest.start_date = parse_day(flag, value);
        } else if (flag == "--end") {
            cfg.backtest.end_date = parse_day(flag, value);
        } else if (flag == "--capital") {
            cfg.backtest.initial_capital = parse_double(flag, value);
        } else if (flag == "--method") {
            const auto m = rebal::preselection::parse_method(value);
            if (!m) throw std::invalid_argument(flag + ": unknown method '" + value + "'");
            cfg.preselection.method = *m;
        } else if (flag == "--top-k") {
            cfg.preselection.top_k = parse_int(flag, value);
        } else if (flag == "--lookback") {
            cfg.preselection.lookback       = parse_int(flag, value);
            cfg.backtest.lookback_periods   = cfg.preselection.lookback;
        } else if (flag == "--skip") {
            cfg.preselection.skip = parse_int(flag, value);
        } else if (flag == "--min-periods") {
            cfg.preselection.min_periods = parse_int(flag, value);
        } else if (flag == "--min-history-days") {
            cfg.eligibility.min_history_days = parse_int(flag, value);
        } else if (flag == "--min-rows") {
            cfg.eligibility.min_price_rows = parse_int(flag, value);
        } else if (flag == "--lookforward") {
            cfg.eligibility.lookforward_days = parse_int(flag, value);
        } else if (flag == "--buffer-rank") {
            cfg.membership.buffer_rank = parse_int(flag, value);
        } else if (flag == "--min-hold") {
            cfg.membership.min_holding_periods = parse_int(flag, value);
        } else if (flag == "--max-turnover") {
            cfg.membership.max_turnover = parse_double(flag, value);
        } else if (flag == "--max-new") {
            cfg.membership.max_new_assets = parse_int(flag, value);
        } else if (flag == "--max-removed") {
            cfg.membership.max_removed_assets = parse_int(flag, value);
        } else if (flag == "--frequency") {
            const auto f = rebal::backtest::parse_frequency(value);
            if (!f) throw std::invalid_argument(flag + ": unknown frequency '" + value + "'");
            cfg.backtest.frequency = *f;
        } else if (flag == "--optimizer") {
            const auto k = rebal::optimizer::parse_optimizer_kind(value);
            if (!k) throw std::invalid_argument(flag + ": unknown optimizer '" + value + "'");
            cfg.optimizer.kind = *k;
        } else if (flag == "--max-weight") {
            cfg.optimizer.constraints.max_weight = parse_double(flag, value);
        } else if (flag == "--threads") {
            const int n = parse_int(flag, value);
            if (n < 1) throw std::invalid_argument(flag + ": must be >= 1");
            cfg.worker_threads = static_cast<std::size_t>(n);
        } else if (flag == "--log-level") {
            const auto lvl = rebal::log::parse_level(value);
            if (!lvl) throw std::invalid_argument(flag + ": unknown level '" + value + "'");
            opts.log_level = *lvl;
        } else if (flag == "--log-file") {
            opts.log_file = value;
        } else {
            throw std::invalid_argument("unknown option " + flag);
        }
    }

    if (opts.prices.empty()) {
        throw std::invalid_argument("--prices is required");
    }
    return opts;
}

/// Load prices, run the backtest and print the report.
/// Returns 0 on success, 1 on error.
int run_backtest(const CliOptions& opts) {
    auto loaded = rebal::core::PriceLoader::load_csv(opts.prices);
    if (!loaded) {
        fmt::print(stderr, "Error: cannot read price file '{}'\n", opts.prices);
        return 1;
    }
    if (loaded->table.assets().empty()) {
        fmt::print(stderr, "Error: no valid observations loaded from '{}'\n", opts.prices);
        return 1;
    }

    fmt::print("Loaded {} rows ({} skipped), {} assets, {} trading days from '{}'\n",
               loaded->rows_accepted, loaded->rows_skipped, loaded->table.assets().size(),
               loaded->table.calendar().size(), opts.prices);

    rebal::backtest::BacktestEngine engine(loaded->table, opts.config);
    const auto result = engine.run();

    fmt::print("\nRebalances\n");
    for (const auto& event : result.events) {
        fmt::print("  {}\n", event.to_string());
    }

    const auto counters = engine.cache_counters();
    fmt::print("\nFinal holdings: {}  cash: {:.2f}\n",
               result.final_state.holdings.size(), result.final_state.cash);
    fmt::print("Cache: hits={} misses={} evictions={} hit rate={:.1f}%\n\n",
               counters.hits, counters.misses, counters.evictions,
               counters.hit_rate() * 100.0);
    fmt::print("{}", result.metrics.to_string());
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string first(argv[1]);
    if (first == "--help" || first == "-h") {
        print_usage();
        return 0;
    }

    CliOptions opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        print_usage();
        return 1;
    }

    try {
        rebal::log::init(opts.log_level, opts.log_file);
        return run_backtest(opts);
    } catch (const rebal::ConfigurationError& e) {
        fmt::print(stderr, "Configuration error: {}\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
