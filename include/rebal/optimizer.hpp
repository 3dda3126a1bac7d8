#pragma once

/// @file include/rebal/optimizer.hpp
/// @brief Pluggable portfolio optimizer boundary.
///
/// # Module: Optimizer
///
/// ## Contract
/// `optimize(candidate_returns, constraints) -> weights` where
/// `candidate_returns` is a T × N window (oldest row first, NaN where an asset
/// did not trade) and the result has one weight per column. An optimizer that
/// cannot produce a feasible vector throws `OptimizationInfeasible`; the
/// rebalance loop catches it and equal-weights the candidates instead.
///
/// ## Implementations
/// - EqualWeight: 1/N, each capped at `max_weight` (never throws)
/// - InverseVolatility: w ∝ 1/σ_i
/// - MinVariance: w ∝ Σ⁻¹·1 (long-only unless `allow_short`)
///
/// The cardinality-constrained kinds are recognised names without an
/// implementation; selecting one is a configuration error.

#include "rebal/types.hpp"

#include <memory>
#include <optional>
#include <string_view>

namespace rebal::optimizer {

enum class OptimizerKind {
    EqualWeight,
    InverseVolatility,
    MinVariance,
    CardinalityMiqp,
    CardinalityHeuristic,
    CardinalityRelaxation,
};

[[nodiscard]] std::string_view to_string(OptimizerKind kind) noexcept;

/// Parse `equal_weight | inverse_volatility | min_variance | cardinality_miqp |
/// cardinality_heuristic | cardinality_relaxation`.
[[nodiscard]] std::optional<OptimizerKind> parse_optimizer_kind(std::string_view name) noexcept;

/// `false` for the cardinality kinds.
[[nodiscard]] bool is_implemented(OptimizerKind kind) noexcept;

struct OptimizationConstraints {
    double max_weight  = 1.0;    ///< Upper bound per asset, in (0, 1]
    bool   allow_short = false;  ///< Permit negative weights
};

struct OptimizerConfig {
    OptimizerKind           kind = OptimizerKind::EqualWeight;
    OptimizationConstraints constraints;

    /// # Throws
    /// `ConfigurationError` for an unimplemented kind or a `max_weight`
    /// outside (0, 1].
    void validate() const;
};

// ─── Optimizer ────────────────────────────────────────────────────────────────

class Optimizer {
public:
    virtual ~Optimizer() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// # Throws
    /// `OptimizationInfeasible` when no feasible weight vector exists.
    [[nodiscard]] virtual WeightVector
    optimize(const ReturnMatrix& candidate_returns,
             const OptimizationConstraints& constraints) const = 0;
};

class EqualWeightOptimizer final : public Optimizer {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "equal_weight"; }
    [[nodiscard]] WeightVector optimize(const ReturnMatrix& candidate_returns,
                                        const OptimizationConstraints& constraints) const override;
};

class InverseVolatilityOptimizer final : public Optimizer {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "inverse_volatility"; }
    [[nodiscard]] WeightVector optimize(const ReturnMatrix& candidate_returns,
                                        const OptimizationConstraints& constraints) const override;
};

class MinVarianceOptimizer final : public Optimizer {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "min_variance"; }
    [[nodiscard]] WeightVector optimize(const ReturnMatrix& candidate_returns,
                                        const OptimizationConstraints& constraints) const override;
};

/// # Throws
/// `ConfigurationError` for an unimplemented kind.
[[nodiscard]] std::unique_ptr<Optimizer> make_optimizer(OptimizerKind kind);

/// Equal weights for `n` assets, each capped at `max_weight`.
[[nodiscard]] WeightVector equal_weights(Eigen::Index n, double max_weight = 1.0);

/// `true` if every weight is finite, non-negative unless `allow_short`, and
/// the sum is at most 1 (+1e-9).
[[nodiscard]] bool weights_valid(const WeightVector& w,
                                 const OptimizationConstraints& constraints) noexcept;

}  // namespace rebal::optimizer
