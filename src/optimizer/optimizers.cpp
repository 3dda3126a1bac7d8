/// @file src/optimizer/optimizers.cpp
/// @brief Reference optimizer implementations.

#include "rebal/optimizer.hpp"
#include "rebal/constants.hpp"
#include "rebal/errors.hpp"

#include <Eigen/LU>

#include <algorithm>
#include <cmath>
#include <string>

namespace rebal::optimizer {

namespace {

/// Replace NaN (no trade) by a zero return.
[[nodiscard]] ReturnMatrix clean(const ReturnMatrix& r) {
    return r.unaryExpr([](double x) { return std::isfinite(x) ? x : 0.0; });
}

[[nodiscard]] Eigen::VectorXd column_stddev(const ReturnMatrix& r) {
    const Eigen::Index t = r.rows();
    const Eigen::RowVectorXd mu = r.colwise().mean();
    const ReturnMatrix centered = r.rowwise() - mu;
    return (centered.colwise().squaredNorm() / static_cast<double>(t - 1)).cwiseSqrt().transpose();
}

/// Enforce w_i ≤ max_weight on a long-only vector summing to 1 by moving the
/// excess onto uncapped names in proportion to their weight.
void cap_weights(WeightVector& w, double max_weight) {
    if (max_weight >= 1.0) return;
    if (max_weight * static_cast<double>(w.size()) < 1.0 - constants::WEIGHT_SUM_TOLERANCE) {
        throw OptimizationInfeasible("max_weight too small for the number of candidates");
    }

    for (Eigen::Index iter = 0; iter <= w.size(); ++iter) {
        double excess = 0.0;
        for (Eigen::Index i = 0; i < w.size(); ++i) {
            if (w[i] > max_weight) {
                excess += w[i] - max_weight;
                w[i] = max_weight;
            }
        }
        if (excess <= constants::WEIGHT_SUM_TOLERANCE) return;

        double free_sum = 0.0;
        for (Eigen::Index i = 0; i < w.size(); ++i) {
            if (w[i] < max_weight) free_sum += w[i];
        }
        if (free_sum <= 0.0) {
            throw OptimizationInfeasible("no uncapped weight left to absorb the excess");
        }
        for (Eigen::Index i = 0; i < w.size(); ++i) {
            if (w[i] < max_weight) w[i] += excess * w[i] / free_sum;
        }
    }
}

}  // namespace

// ─── Names ────────────────────────────────────────────────────────────────────

std::string_view to_string(OptimizerKind kind) noexcept {
    switch (kind) {
        case OptimizerKind::EqualWeight:           return "equal_weight";
        case OptimizerKind::InverseVolatility:     return "inverse_volatility";
        case OptimizerKind::MinVariance:           return "min_variance";
        case OptimizerKind::CardinalityMiqp:       return "cardinality_miqp";
        case OptimizerKind::CardinalityHeuristic:  return "cardinality_heuristic";
        case OptimizerKind::CardinalityRelaxation: return "cardinality_relaxation";
    }
    return "unknown";
}

std::optional<OptimizerKind> parse_optimizer_kind(std::string_view name) noexcept {
    for (auto kind : {OptimizerKind::EqualWeight, OptimizerKind::InverseVolatility,
                      OptimizerKind::MinVariance, OptimizerKind::CardinalityMiqp,
                      OptimizerKind::CardinalityHeuristic,
                      OptimizerKind::CardinalityRelaxation}) {
        if (to_string(kind) == name) return kind;
    }
    return std::nullopt;
}

bool is_implemented(OptimizerKind kind) noexcept {
    switch (kind) {
        case OptimizerKind::EqualWeight:
        case OptimizerKind::InverseVolatility:
        case OptimizerKind::MinVariance:
            return true;
        case OptimizerKind::CardinalityMiqp:
        case OptimizerKind::CardinalityHeuristic:
        case OptimizerKind::CardinalityRelaxation:
            return false;
    }
    return false;
}

void OptimizerConfig::validate() const {
    if (!is_implemented(kind)) {
        throw ConfigurationError("optimizer.kind",
                                 std::string(to_string(kind)) + " is not implemented");
    }
    if (!(constraints.max_weight > 0.0 && constraints.max_weight <= 1.0)) {
        throw ConfigurationError("optimizer.max_weight", "must be in (0, 1]");
    }
}

std::unique_ptr<Optimizer> make_optimizer(OptimizerKind kind) {
    switch (kind) {
        case OptimizerKind::EqualWeight:       return std::make_unique<EqualWeightOptimizer>();
        case OptimizerKind::InverseVolatility: return std::make_unique<InverseVolatilityOptimizer>();
        case OptimizerKind::MinVariance:       return std::make_unique<MinVarianceOptimizer>();
        case OptimizerKind::CardinalityMiqp:
        case OptimizerKind::CardinalityHeuristic:
        case OptimizerKind::CardinalityRelaxation:
            break;
    }
    throw ConfigurationError("optimizer.kind",
                             std::string(to_string(kind)) + " is not implemented");
}

// ─── Helpers ──────────────────────────────────────────────────────────────────

WeightVector equal_weights(Eigen::Index n, double max_weight) {
    if (n <= 0) return WeightVector{};
    const double w = std::min(1.0 / static_cast<double>(n), max_weight);
    return WeightVector::Constant(n, w);
}

bool weights_valid(const WeightVector& w, const OptimizationConstraints& constraints) noexcept {
    double sum = 0.0;
    for (Eigen::Index i = 0; i < w.size(); ++i) {
        if (!std::isfinite(w[i])) return false;
        if (!constraints.allow_short && w[i] < 0.0) return false;
        sum += w[i];
    }
    return sum <= 1.0 + constants::WEIGHT_SUM_TOLERANCE;
}

// ─── EqualWeight ──────────────────────────────────────────────────────────────

WeightVector EqualWeightOptimizer::optimize(const ReturnMatrix&            candidate_returns,
                                            const OptimizationConstraints& constraints) const {
    return equal_weights(candidate_returns.cols(), constraints.max_weight);
}

// ─── InverseVolatility ────────────────────────────────────────────────────────

WeightVector InverseVolatilityOptimizer::optimize(const ReturnMatrix&            candidate_returns,
                                                  const OptimizationConstraints& constraints) const {
    const Eigen::Index n = candidate_returns.cols();
    if (n == 0) return WeightVector{};
    if (candidate_returns.rows() < 2) {
        throw OptimizationInfeasible("inverse volatility needs at least two return rows");
    }

    const Eigen::VectorXd sd = column_stddev(clean(candidate_returns));
    if (sd.minCoeff() <= constants::COVARIANCE_SINGULARITY_EPSILON) {
        throw OptimizationInfeasible("zero volatility candidate");
    }

    WeightVector w = sd.cwiseInverse();
    w /= w.sum();
    cap_weights(w, constraints.max_weight);
    return w;
}

// ─── MinVariance ──────────────────────────────────────────────────────────────

WeightVector MinVarianceOptimizer::optimize(const ReturnMatrix&            candidate_returns,
                                            const OptimizationConstraints& constraints) const {
    const Eigen::Index n = candidate_returns.cols();
    const Eigen::Index t = candidate_returns.rows();
    if (n == 0) return WeightVector{};
    if (t < 2) {
        throw OptimizationInfeasible("min variance needs at least two return rows");
    }

    // Sample covariance Σ = Xᶜᵀ Xᶜ / (T − 1)
    const ReturnMatrix x = clean(candidate_returns);
    const ReturnMatrix centered = x.rowwise() - x.colwise().mean();
    const Eigen::MatrixXd cov = (centered.transpose() * centered) / static_cast<double>(t - 1);

    // Full-pivoting LU detects near-singularity reliably.
    Eigen::FullPivLU<Eigen::MatrixXd> lu(cov);
    lu.setThreshold(constants::COVARIANCE_SINGULARITY_EPSILON);
    if (!lu.isInvertible()) {
        throw OptimizationInfeasible("singular covariance matrix");
    }

    WeightVector w = lu.solve(Eigen::VectorXd::Ones(n));
    const double total = w.sum();
    if (!std::isfinite(total) || total <= 0.0) {
        throw OptimizationInfeasible("covariance solve produced a non-positive budget");
    }
    w /= total;

    if (!constraints.allow_short) {
        w = w.cwiseMax(0.0);
        const double kept = w.sum();
        if (kept <= 0.0) {
            throw OptimizationInfeasible("no positive weight after removing shorts");
        }
        w /= kept;
        cap_weights(w, constraints.max_weight);
    } else if (w.maxCoeff() > constraints.max_weight + constants::WEIGHT_SUM_TOLERANCE) {
        throw OptimizationInfeasible("max_weight violated with short selling enabled");
    }
    return w;
}

}  // namespace rebal::optimizer
