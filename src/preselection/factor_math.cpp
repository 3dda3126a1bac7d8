/// @file src/preselection/factor_math.cpp
/// @brief NaN-aware window statistics.

#include "preselection/factor_math.hpp"

#include <cmath>

namespace rebal::preselection::detail {

std::size_t count_finite(const Eigen::Ref<const Eigen::VectorXd>& r) noexcept {
    std::size_t n = 0;
    for (Eigen::Index i = 0; i < r.size(); ++i) {
        if (std::isfinite(r[i])) ++n;
    }
    return n;
}

std::optional<double> compound_return(const Eigen::Ref<const Eigen::VectorXd>& r) noexcept {
    double growth = 1.0;
    std::size_t n = 0;
    for (Eigen::Index i = 0; i < r.size(); ++i) {
        if (!std::isfinite(r[i])) continue;
        growth *= 1.0 + r[i];
        ++n;
    }
    if (n == 0) return std::nullopt;
    return growth - 1.0;
}

std::optional<double> sample_stddev(const Eigen::Ref<const Eigen::VectorXd>& r) noexcept {
    // Two-pass: mean first, then squared deviations.
    double sum = 0.0;
    std::size_t n = 0;
    for (Eigen::Index i = 0; i < r.size(); ++i) {
        if (!std::isfinite(r[i])) continue;
        sum += r[i];
        ++n;
    }
    if (n < 2) return std::nullopt;

    const double mean = sum / static_cast<double>(n);
    double ss = 0.0;
    for (Eigen::Index i = 0; i < r.size(); ++i) {
        if (!std::isfinite(r[i])) continue;
        const double d = r[i] - mean;
        ss += d * d;
    }
    return std::sqrt(ss / static_cast<double>(n - 1));
}

std::vector<double> zscores(std::span<const double> values, double flat_threshold) {
    std::vector<double> z(values.size(), 0.0);

    double sum = 0.0;
    std::size_t n = 0;
    for (double v : values) {
        if (!std::isfinite(v)) continue;
        sum += v;
        ++n;
    }
    if (n < 2) return z;

    const double mean = sum / static_cast<double>(n);
    double ss = 0.0;
    for (double v : values) {
        if (!std::isfinite(v)) continue;
        ss += (v - mean) * (v - mean);
    }
    const double sd = std::sqrt(ss / static_cast<double>(n - 1));
    if (sd < flat_threshold) return z;

    for (std::size_t i = 0; i < values.size(); ++i) {
        if (std::isfinite(values[i])) z[i] = (values[i] - mean) / sd;
    }
    return z;
}

}  // namespace rebal::preselection::detail
