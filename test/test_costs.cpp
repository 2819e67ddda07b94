/**
 * @file test_costs.cpp
 * @brief Unit tests for the transaction cost models
 */

#include "TestHarness.hpp"
#include <factorlab/Errors.hpp>
#include <factorlab/TransactionCost.hpp>
#include <Eigen/Dense>
#include <cmath>

using namespace factorlab;

// =============================================================================
// SQUARE-ROOT IMPACT TESTS
// =============================================================================

TEST(sqrt_impact_known_values) {
    SqrtImpactParams params;
    params.k = 0.2;
    params.daily_vol = 0.03;

    ASSERT_NEAR(sqrt_impact_cost(0.01, params), 0.0006, 1e-15);
    ASSERT_NEAR(sqrt_impact_cost(0.04, params), 0.0012, 1e-15);
}

TEST(sqrt_impact_defaults) {
    // k = 0.1, daily_vol = 0.02
    ASSERT_NEAR(sqrt_impact_cost(0.25), 0.1 * 0.02 * 0.5, 1e-15);
}

TEST(sqrt_impact_sign_and_zero) {
    ASSERT_TRUE(sqrt_impact_cost(0.0) == 0.0);
    ASSERT_TRUE(sqrt_impact_cost(-0.09) < 0.0);
    ASSERT_NEAR(sqrt_impact_cost(-0.09), -sqrt_impact_cost(0.09), 1e-15);
}

TEST(sqrt_impact_quadrupling_doubles_cost) {
    const double small = sqrt_impact_cost(1.0);
    const double large = sqrt_impact_cost(4.0);
    ASSERT_NEAR(large, 2.0 * small, 1e-15);
}

TEST(sqrt_impact_vector_matches_scalar) {
    Eigen::VectorXd trades(4);
    trades << 0.01, -0.04, 0.0, 0.16;

    SqrtImpactParams params;
    params.k = 0.15;
    const Eigen::VectorXd costs = sqrt_impact(trades, params);

    ASSERT_TRUE(costs.size() == trades.size());
    for (Eigen::Index i = 0; i < trades.size(); ++i) {
        ASSERT_NEAR(costs(i), sqrt_impact_cost(trades(i), params), 1e-15);
    }
}

TEST(sqrt_impact_rejects_bad_params) {
    SqrtImpactParams params;
    params.k = -0.1;
    ASSERT_THROWS(sqrt_impact_cost(0.01, params), ValidationError);

    params.k = 0.1;
    params.daily_vol = std::nan("");
    ASSERT_THROWS(sqrt_impact_cost(0.01, params), ValidationError);
}

// =============================================================================
// ALMGREN-CHRISS TESTS
// =============================================================================

TEST(almgren_chriss_params_constructor) {
    const AlmgrenChrissParams params(0.01, 0.1);
    ASSERT_NEAR(params.permanent_cost_per_share, 0.01, 0.0);
    ASSERT_NEAR(params.eta, 0.1, 0.0);
    ASSERT_NEAR(params.time_horizon, 1.0, 0.0);

    // Both coefficients feed the cost; neither is silently zero
    ASSERT_NEAR(almgren_chriss_cost(100.0, AlmgrenChrissParams(0.01, 0.0)), 1.0, 1e-12);
    ASSERT_NEAR(almgren_chriss_cost(100.0, AlmgrenChrissParams(0.0, 0.1)), 10.0, 1e-12);

    ASSERT_THROWS(almgren_chriss_cost(100.0, AlmgrenChrissParams(0.01, std::nan(""))), ValidationError);
}

TEST(almgren_chriss_known_value) {
    const AlmgrenChrissParams params(0.01, 0.1, 1.0);

    ASSERT_NEAR(almgren_chriss_cost(1000.0, params), 110.0, 1e-9);
    ASSERT_TRUE(almgren_chriss_cost(0.0, params) == 0.0);
}

TEST(almgren_chriss_monotone_in_size) {
    const AlmgrenChrissParams params(0.01, 0.1);

    double previous = almgren_chriss_cost(0.0, params);
    for (double shares = 100.0; shares <= 1000.0; shares += 100.0) {
        const double cost = almgren_chriss_cost(shares, params);
        ASSERT_TRUE(cost > previous);
        previous = cost;
    }
}

TEST(almgren_chriss_urgency_raises_cost) {
    const AlmgrenChrissParams patient(0.01, 0.1, 1.0);

    AlmgrenChrissParams urgent = patient;
    urgent.time_horizon = 0.5;

    ASSERT_TRUE(almgren_chriss_cost(500.0, urgent) > almgren_chriss_cost(500.0, patient));
    ASSERT_NEAR(almgren_chriss_cost(500.0, urgent), 5.0 + 100.0, 1e-9);
}

TEST(almgren_chriss_vector_matches_scalar) {
    const AlmgrenChrissParams params(0.02, 0.05, 2.0);

    Eigen::VectorXd shares(3);
    shares << 100.0, -250.0, 0.0;
    const Eigen::VectorXd costs = almgren_chriss(shares, params);

    ASSERT_TRUE(costs.size() == 3);
    for (Eigen::Index i = 0; i < shares.size(); ++i) {
        ASSERT_NEAR(costs(i), almgren_chriss_cost(shares(i), params), 1e-12);
    }
}

TEST(almgren_chriss_rejects_non_positive_horizon) {
    AlmgrenChrissParams params(0.0, 0.1, 0.0);
    ASSERT_THROWS(almgren_chriss_cost(100.0, params), ValidationError);

    params.time_horizon = -1.0;
    Eigen::VectorXd shares = Eigen::VectorXd::Constant(2, 100.0);
    ASSERT_THROWS(almgren_chriss(shares, params), ValidationError);
}

// =============================================================================
// SUITE
// =============================================================================

void run_cost_tests() {
    RUN_TEST(sqrt_impact_known_values);
    RUN_TEST(sqrt_impact_defaults);
    RUN_TEST(sqrt_impact_sign_and_zero);
    RUN_TEST(sqrt_impact_quadrupling_doubles_cost);
    RUN_TEST(sqrt_impact_vector_matches_scalar);
    RUN_TEST(sqrt_impact_rejects_bad_params);
    RUN_TEST(almgren_chriss_params_constructor);
    RUN_TEST(almgren_chriss_known_value);
    RUN_TEST(almgren_chriss_monotone_in_size);
    RUN_TEST(almgren_chriss_urgency_raises_cost);
    RUN_TEST(almgren_chriss_vector_matches_scalar);
    RUN_TEST(almgren_chriss_rejects_non_positive_horizon);
}
