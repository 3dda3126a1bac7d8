/// @file src/preselection/preselection.cpp
/// @brief Factor scoring and ranking.

#include "rebal/preselection.hpp"
#include "rebal/errors.hpp"
#include "rebal/logging.hpp"

#include "core/parallel.hpp"
#include "preselection/factor_math.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace rebal::preselection {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

[[nodiscard]] double value_or_nan(const std::optional<double>& v) noexcept {
    return v ? *v : NaN;
}

}  // namespace

// ─── Method names ─────────────────────────────────────────────────────────────

std::string_view to_string(PreselectionMethod method) noexcept {
    switch (method) {
        case PreselectionMethod::Momentum:      return "momentum";
        case PreselectionMethod::LowVolatility: return "low_volatility";
        case PreselectionMethod::Combined:      return "combined";
    }
    return "unknown";
}

std::optional<PreselectionMethod> parse_method(std::string_view name) noexcept {
    if (name == "momentum")       return PreselectionMethod::Momentum;
    if (name == "low_volatility") return PreselectionMethod::LowVolatility;
    if (name == "combined")       return PreselectionMethod::Combined;
    return std::nullopt;
}

// ─── PreselectionConfig::validate ─────────────────────────────────────────────

void PreselectionConfig::validate() const {
    if (lookback < 1) {
        throw ConfigurationError("preselection.lookback", "must be >= 1");
    }
    if (skip < 0 || skip >= lookback) {
        throw ConfigurationError("preselection.skip", "must satisfy 0 <= skip < lookback");
    }
    if (min_periods < 1 || min_periods > lookback) {
        throw ConfigurationError("preselection.min_periods",
                                 "must satisfy 1 <= min_periods <= lookback");
    }
    if (top_k < 0) {
        throw ConfigurationError("preselection.top_k", "must be >= 0");
    }
    if (!std::isfinite(momentum_weight) || !std::isfinite(low_vol_weight) ||
        std::abs(momentum_weight + low_vol_weight - 1.0) > constants::FACTOR_WEIGHT_TOLERANCE) {
        throw ConfigurationError("preselection.weights", "momentum and low-vol weights must sum to 1.0");
    }
}

// ─── Preselection ─────────────────────────────────────────────────────────────

Preselection::Preselection(const core::PriceTable& table,
                           stats::StatisticsCache& cache,
                           PreselectionConfig      config)
    : table_(table)
    , cache_(cache)
    , config_(std::move(config))
    , generation_(table.generation()) {
    config_.validate();
}

Preselection::Window Preselection::lookback_window(Date date) const noexcept {
    const std::size_t e        = table_.rows_before(date);
    const auto        lookback = static_cast<std::size_t>(config_.lookback);
    const std::size_t first    = e > lookback ? e - lookback : 0;
    return Window{.first = first, .count = e - first};
}

Preselection::Window Preselection::momentum_window(Date date) const noexcept {
    const std::size_t e    = table_.rows_before(date);
    const auto        skip = static_cast<std::size_t>(config_.skip);
    Window w = lookback_window(date);
    const std::size_t end = e > skip ? e - skip : 0;
    w.count = end > w.first ? end - w.first : 0;
    return w;
}

double Preselection::cached(std::size_t column, stats::StatKind kind, Window w) const {
    if (w.count == 0) {
        return kind == stats::StatKind::ValidCount ? 0.0 : NaN;
    }

    const Date end_date = table_.calendar()[w.first + w.count - 1];
    return cache_.get_or_compute(
        table_.assets()[column], kind, w.count, end_date,
        [this, column, kind, w] {
            const Eigen::VectorXd r = table_.return_window(column, w.first, w.count);
            switch (kind) {
                case stats::StatKind::Momentum:
                    return value_or_nan(detail::compound_return(r));
                case stats::StatKind::Volatility:
                    return value_or_nan(detail::sample_stddev(r));
                case stats::StatKind::ValidCount:
                    return static_cast<double>(detail::count_finite(r));
            }
            return NaN;
        });
}

std::optional<double> Preselection::momentum_score(const AssetId& asset, Date date) const {
    const auto col = table_.column_of(asset);
    if (!col) return std::nullopt;
    const double m = cached(*col, stats::StatKind::Momentum, momentum_window(date));
    if (!std::isfinite(m)) return std::nullopt;
    return m;
}

std::optional<double> Preselection::low_volatility_score(const AssetId& asset, Date date) const {
    const auto col = table_.column_of(asset);
    if (!col) return std::nullopt;
    const double sd = cached(*col, stats::StatKind::Volatility, lookback_window(date));
    if (!std::isfinite(sd)) return std::nullopt;
    return 1.0 / (sd + constants::LOW_VOL_EPSILON);
}

std::size_t Preselection::valid_periods(const AssetId& asset, Date date) const {
    const auto col = table_.column_of(asset);
    if (!col) return 0;
    return static_cast<std::size_t>(
        cached(*col, stats::StatKind::ValidCount, lookback_window(date)));
}

// ─── Ranking ──────────────────────────────────────────────────────────────────

std::vector<RankedCandidate>
Preselection::rank(std::span<const AssetId> eligible, Date date, std::size_t threads) const {
    if (table_.generation() != generation_) {
        REBAL_LOG_DEBUG("price table changed (generation {} -> {}); clearing statistics cache",
                        generation_, table_.generation());
        cache_.clear();
        generation_ = table_.generation();
    }

    // ── Step 1: secondary filter + raw factor scores (per asset, parallel) ───
    const auto min_periods = static_cast<std::size_t>(config_.min_periods);
    std::vector<char>   qualifies(eligible.size(), 0);
    std::vector<double> mom(eligible.size(), NaN);
    std::vector<double> lvol(eligible.size(), NaN);

    core::parallel_for(eligible.size(), threads, [&](std::size_t i) {
        if (valid_periods(eligible[i], date) < min_periods) return;
        qualifies[i] = 1;
        if (config_.method != PreselectionMethod::LowVolatility) {
            mom[i] = value_or_nan(momentum_score(eligible[i], date));
        }
        if (config_.method != PreselectionMethod::Momentum) {
            lvol[i] = value_or_nan(low_volatility_score(eligible[i], date));
        }
    });

    // ── Step 2: composite score over the qualifying subset ───────────────────
    std::vector<std::size_t> idx;
    for (std::size_t i = 0; i < eligible.size(); ++i) {
        if (qualifies[i]) idx.push_back(i);
    }

    std::vector<RankedCandidate> out;
    out.reserve(idx.size());

    if (config_.method == PreselectionMethod::Combined) {
        std::vector<double> m, v;
        m.reserve(idx.size());
        v.reserve(idx.size());
        for (auto i : idx) {
            m.push_back(mom[i]);
            v.push_back(lvol[i]);
        }
        const auto zm = detail::zscores(m, constants::FLAT_STDDEV_THRESHOLD);
        const auto zv = detail::zscores(v, constants::FLAT_STDDEV_THRESHOLD);
        for (std::size_t k = 0; k < idx.size(); ++k) {
            if (!std::isfinite(m[k]) && !std::isfinite(v[k])) continue;
            out.push_back(RankedCandidate{
                .asset_id = eligible[idx[k]],
                .score    = config_.momentum_weight * zm[k] + config_.low_vol_weight * zv[k],
                .rank     = 0});
        }
    } else {
        const auto& raw = config_.method == PreselectionMethod::Momentum ? mom : lvol;
        for (auto i : idx) {
            if (!std::isfinite(raw[i])) continue;
            out.push_back(RankedCandidate{.asset_id = eligible[i], .score = raw[i], .rank = 0});
        }
    }

    // ── Step 3: total order ──────────────────────────────────────────────────
    std::sort(out.begin(), out.end(), [](const RankedCandidate& a, const RankedCandidate& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.asset_id < b.asset_id;
    });
    for (std::size_t r = 0; r < out.size(); ++r) {
        out[r].rank = r + 1;
    }

    REBAL_LOG_DEBUG("preselection {} on {}: {} eligible, {} ranked",
                    to_string(config_.method), format_date(date), eligible.size(), out.size());
    return out;
}

std::vector<RankedCandidate>
Preselection::select(std::span<const AssetId> eligible, Date date, std::size_t threads) const {
    auto ranked = rank(eligible, date, threads);
    if (config_.top_k > 0 && ranked.size() > static_cast<std::size_t>(config_.top_k)) {
        ranked.resize(static_cast<std::size_t>(config_.top_k));
    }
    return ranked;
}

// ─── Free-function form ───────────────────────────────────────────────────────

std::vector<RankedCandidate>
select(const core::PriceTable&  table,
       stats::StatisticsCache&  cache,
       std::span<const AssetId> eligible,
       Date                     date,
       PreselectionMethod       method,
       int                      top_k,
       int                      lookback,
       int                      skip,
       double                   momentum_weight,
       double                   low_vol_weight,
       int                      min_periods) {
    const Preselection engine(table, cache,
                              PreselectionConfig{.method          = method,
                                                 .top_k           = top_k,
                                                 .lookback        = lookback,
                                                 .skip            = skip,
                                                 .min_periods     = min_periods,
                                                 .momentum_weight = momentum_weight,
                                                 .low_vol_weight  = low_vol_weight});
    return engine.select(eligible, date);
}

}  // namespace rebal::preselection
