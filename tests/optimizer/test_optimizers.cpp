#include <gtest/gtest.h>
#include "rebal/errors.hpp"
#include "rebal/optimizer.hpp"

#include <cmath>
#include <limits>
#include <random>

using namespace rebal;
using namespace rebal::optimizer;

namespace {

/// Two uncorrelated zero-mean columns with σ_A : σ_B = a : b.
ReturnMatrix orthogonal_pair(double a, double b) {
    ReturnMatrix r(4, 2);
    r <<  a,  b,
         -a,  b,
          a, -b,
         -a, -b;
    return r;
}

ReturnMatrix random_returns(Eigen::Index rows, Eigen::Index cols, unsigned seed) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> noise(0.0, 0.01);
    ReturnMatrix r(rows, cols);
    for (Eigen::Index i = 0; i < rows; ++i)
        for (Eigen::Index j = 0; j < cols; ++j)
            r(i, j) = noise(rng) * static_cast<double>(j + 1);
    return r;
}

}  // namespace

// ─── Names & factory ──────────────────────────────────────────────────────────

TEST(Optimizer_Factory, ParseKnownNames) {
    EXPECT_TRUE(parse_optimizer_kind("min_variance") == OptimizerKind::MinVariance);
    EXPECT_TRUE(parse_optimizer_kind("cardinality_miqp") == OptimizerKind::CardinalityMiqp);
    EXPECT_FALSE(parse_optimizer_kind("black_litterman").has_value());
}

TEST(Optimizer_Factory, CardinalityKindsAreConfigurationErrors) {
    for (auto kind : {OptimizerKind::CardinalityMiqp, OptimizerKind::CardinalityHeuristic,
                      OptimizerKind::CardinalityRelaxation}) {
        EXPECT_FALSE(is_implemented(kind));
        EXPECT_THROW((void)make_optimizer(kind), ConfigurationError);
        EXPECT_THROW(OptimizerConfig{.kind = kind}.validate(), ConfigurationError);
    }
    EXPECT_EQ(make_optimizer(OptimizerKind::InverseVolatility)->name(), "inverse_volatility");
}

TEST(Optimizer_Factory, MaxWeightRange) {
    EXPECT_THROW((OptimizerConfig{.constraints = {.max_weight = 0.0}}.validate()),
                 ConfigurationError);
    EXPECT_THROW((OptimizerConfig{.constraints = {.max_weight = 1.5}}.validate()),
                 ConfigurationError);
    EXPECT_NO_THROW((OptimizerConfig{.constraints = {.max_weight = 0.2}}.validate()));
}

// ─── EqualWeight ──────────────────────────────────────────────────────────────

TEST(Optimizer_EqualWeight, OneOverN) {
    const auto w = EqualWeightOptimizer{}.optimize(random_returns(10, 4, 1), {});
    ASSERT_EQ(w.size(), 4);
    for (Eigen::Index i = 0; i < w.size(); ++i) EXPECT_DOUBLE_EQ(w[i], 0.25);
}

TEST(Optimizer_EqualWeight, CapLeavesCash) {
    const auto w = equal_weights(2, 0.3);
    EXPECT_DOUBLE_EQ(w[0], 0.3);
    EXPECT_DOUBLE_EQ(w.sum(), 0.6);
    EXPECT_EQ(equal_weights(0).size(), 0);
}

// ─── InverseVolatility ────────────────────────────────────────────────────────

TEST(Optimizer_InverseVolatility, WeightsProportionalToInverseSigma) {
    const auto w = InverseVolatilityOptimizer{}.optimize(orthogonal_pair(0.01, 0.02), {});
    EXPECT_NEAR(w[0], 2.0 / 3.0, 1e-12);
    EXPECT_NEAR(w[1], 1.0 / 3.0, 1e-12);
}

TEST(Optimizer_InverseVolatility, MissingReturnsTreatedAsFlat) {
    ReturnMatrix r = orthogonal_pair(0.01, 0.02);
    r(0, 0) = std::numeric_limits<double>::quiet_NaN();
    const auto w = InverseVolatilityOptimizer{}.optimize(r, {});
    EXPECT_TRUE(weights_valid(w, {}));
    EXPECT_NEAR(w.sum(), 1.0, 1e-12);
}

TEST(Optimizer_InverseVolatility, DegenerateInputsInfeasible) {
    const InverseVolatilityOptimizer opt;
    EXPECT_THROW((void)opt.optimize(ReturnMatrix::Zero(1, 3), {}), OptimizationInfeasible);

    ReturnMatrix flat = orthogonal_pair(0.01, 0.02);
    flat.col(1).setZero();
    EXPECT_THROW((void)opt.optimize(flat, {}), OptimizationInfeasible);
}

// ─── MinVariance ──────────────────────────────────────────────────────────────

TEST(Optimizer_MinVariance, DiagonalCovariance_InverseVarianceWeights) {
    const auto w = MinVarianceOptimizer{}.optimize(orthogonal_pair(0.01, 0.02), {});
    EXPECT_NEAR(w[0], 0.8, 1e-9);
    EXPECT_NEAR(w[1], 0.2, 1e-9);
}

TEST(Optimizer_MinVariance, SingularCovarianceInfeasible) {
    ReturnMatrix r(4, 2);
    r << 0.01, 0.01,
        -0.02, -0.02,
         0.03, 0.03,
         0.00, 0.00;
    EXPECT_THROW((void)MinVarianceOptimizer{}.optimize(r, {}), OptimizationInfeasible);
}

TEST(Optimizer_MinVariance, LongOnlyOnRandomData) {
    const auto w = MinVarianceOptimizer{}.optimize(random_returns(120, 6, 42), {});
    ASSERT_EQ(w.size(), 6);
    EXPECT_GE(w.minCoeff(), 0.0);
    EXPECT_NEAR(w.sum(), 1.0, 1e-9);
    EXPECT_TRUE(weights_valid(w, {}));
}

TEST(Optimizer_MinVariance, CapRedistributesExcess) {
    const auto w = MinVarianceOptimizer{}.optimize(orthogonal_pair(0.01, 0.02),
                                                   {.max_weight = 0.6});
    EXPECT_NEAR(w[0], 0.6, 1e-9);
    EXPECT_NEAR(w[1], 0.4, 1e-9);
}

TEST(Optimizer_MinVariance, CapBelowOneOverNInfeasible) {
    EXPECT_THROW((void)MinVarianceOptimizer{}.optimize(orthogonal_pair(0.01, 0.02),
                                                       {.max_weight = 0.4}),
                 OptimizationInfeasible);
}

// ─── weights_valid ────────────────────────────────────────────────────────────

TEST(Optimizer_WeightsValid, RejectsNaNShortsAndLeverage) {
    WeightVector w(3);
    w << 0.5, 0.3, 0.2;
    EXPECT_TRUE(weights_valid(w, {}));

    w << 0.5, std::numeric_limits<double>::quiet_NaN(), 0.2;
    EXPECT_FALSE(weights_valid(w, {}));

    w << 0.7, -0.1, 0.4;
    EXPECT_FALSE(weights_valid(w, {}));
    EXPECT_TRUE(weights_valid(w, {.allow_short = true}));

    w << 0.6, 0.3, 0.2;
    EXPECT_FALSE(weights_valid(w, {}));
}
