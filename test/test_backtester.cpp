/**
 * @file test_backtester.cpp
 * @brief Unit tests for FactorBacktester and factor score construction
 */

#include "TestHarness.hpp"
#include <factorlab/Errors.hpp>
#include <factorlab/FactorBacktester.hpp>
#include <factorlab/FactorScores.hpp>
#include <factorlab/Panel.hpp>
#include <factorlab/PerformanceStats.hpp>
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace factorlab;

namespace {

const double kNaN = std::numeric_limits<double>::quiet_NaN();

// Five tickers over three dates with factor rising in ticker order. Rows are
// added newest date first to exercise internal sorting.
ObservationPanel monotone_panel(const std::vector<std::vector<double>>& returns_by_date) {
    const std::vector<std::string> tickers = {"AAA", "BBB", "CCC", "DDD", "EEE"};
    const std::vector<Date> dates = {20240131, 20240229, 20240329};

    ObservationPanel panel;
    for (size_t d = dates.size(); d-- > 0;) {
        for (size_t i = 0; i < tickers.size(); ++i) {
            const double factor = static_cast<double>(i) + 0.1 * static_cast<double>(d);
            panel.add_row(dates[d], tickers[i], returns_by_date[d][i], {{"momentum", factor}});
        }
    }
    return panel;
}

std::vector<std::vector<double>> sample_returns() {
    return {
        {0.01, 0.02, -0.01, 0.03, 0.05},
        {-0.02, 0.01, 0.04, 0.00, -0.03},
        {0.03, -0.01, 0.02, 0.01, 0.06},
    };
}

BacktestParams momentum_params(int n_buckets) {
    BacktestParams params;
    params.factor_name = "momentum";
    params.n_buckets = n_buckets;
    return params;
}

} // namespace

// =============================================================================
// END-TO-END TESTS
// =============================================================================

TEST(backtest_single_entity_buckets_compound_directly) {
    const auto returns = sample_returns();
    const ObservationPanel panel = monotone_panel(returns);

    FactorBacktester backtester(momentum_params(5));
    const BacktestResult result = backtester.run(panel);

    // Rows: date 3 first, then date 2, then date 1; ticker i -> bucket i + 1
    ASSERT_TRUE(result.assignments.size() == 15);
    for (size_t row = 0; row < result.assignments.size(); ++row) {
        ASSERT_TRUE(result.assignments[row] == static_cast<int>(row % 5) + 1);
    }

    const BucketReturns& br = result.bucket_returns;
    ASSERT_TRUE(br.dates.size() == 3);
    ASSERT_TRUE(br.dates.front() == 20240131 && br.dates.back() == 20240329);
    ASSERT_TRUE(br.n_buckets() == 5);

    for (int b = 0; b < 5; ++b) {
        double expected = 1.0;
        for (int t = 0; t < 3; ++t) {
            const double r = returns[static_cast<size_t>(t)][static_cast<size_t>(b)];
            expected *= 1.0 + r;
            ASSERT_TRUE(br.counts(t, b) == 1);
            ASSERT_NEAR(br.returns(t, b), r, 1e-15);
            ASSERT_NEAR(result.cumulative(t, b), expected - 1.0, 1e-12);
        }
    }

    const ReturnSeries top = result.cumulative_bucket(5);
    ASSERT_NEAR(top.values(2), 1.05 * 0.97 * 1.06 - 1.0, 1e-12);
    ASSERT_TRUE(result.latency_ns >= 0);
}

TEST(backtest_bucket_means_and_counts) {
    // Seven names on one date into three buckets: sizes 3, 2, 2
    ObservationPanel panel;
    for (int i = 0; i < 7; ++i) {
        panel.add_row(20240131, "E" + std::to_string(i), 0.01 * (i + 1),
                      {{"momentum", static_cast<double>(i)}});
    }

    FactorBacktester backtester(momentum_params(3));
    const BacktestResult result = backtester.run(panel);
    const BucketReturns& br = result.bucket_returns;

    ASSERT_TRUE(br.counts(0, 0) == 3);
    ASSERT_TRUE(br.counts(0, 1) == 2);
    ASSERT_TRUE(br.counts(0, 2) == 2);
    ASSERT_NEAR(br.returns(0, 0), 0.02, 1e-15);
    ASSERT_NEAR(br.returns(0, 1), 0.045, 1e-15);
    ASSERT_NEAR(br.returns(0, 2), 0.065, 1e-15);
}

TEST(backtest_missing_factor_rows_excluded) {
    ObservationPanel panel;
    panel.add_row(1, "A", 0.10, {{"momentum", 1.0}});
    panel.add_row(1, "B", 0.20, {{"momentum", 2.0}});
    panel.add_row(1, "C", 9.99, {{"momentum", kNaN}});
    panel.add_row(1, "D", 0.40, {{"momentum", 3.0}});

    FactorBacktester backtester(momentum_params(3));
    const BacktestResult result = backtester.run(panel);

    ASSERT_TRUE(result.assignments[2] == kUnassigned);
    ASSERT_NEAR(result.bucket_returns.returns(0, 0), 0.10, 1e-15);
    ASSERT_NEAR(result.bucket_returns.returns(0, 1), 0.20, 1e-15);
    ASSERT_NEAR(result.bucket_returns.returns(0, 2), 0.40, 1e-15);
}

TEST(backtest_skip_undersized_dates) {
    ObservationPanel panel;
    panel.add_row(1, "A", 0.01, {{"momentum", 1.0}});
    panel.add_row(1, "B", 0.02, {{"momentum", 2.0}});
    panel.add_row(2, "A", 0.03, {{"momentum", 1.0}});

    BacktestParams params = momentum_params(2);
    ASSERT_THROWS(FactorBacktester(params).run(panel), CardinalityError);

    params.skip_undersized_dates = true;
    FactorBacktester backtester(params);
    const BacktestResult result = backtester.run(panel);

    ASSERT_TRUE(result.bucket_returns.dates.size() == 1);
    ASSERT_TRUE(result.bucket_returns.dates[0] == 1);
    ASSERT_TRUE(result.assignments[2] == kUnassigned);
}

// =============================================================================
// VALIDATION TESTS
// =============================================================================

TEST(backtest_schema_errors_fail_fast) {
    const ObservationPanel panel = monotone_panel(sample_returns());

    BacktestParams params = momentum_params(5);
    params.factor_name = "value";
    FactorBacktester missing_factor(params);
    ASSERT_THROWS(missing_factor.run(panel), SchemaError);
    ASSERT_TRUE(missing_factor.last_latency_ns() == 0);

    ObservationPanel bad_return;
    bad_return.add_row(1, "A", kNaN, {{"momentum", 1.0}});
    bad_return.add_row(1, "B", 0.01, {{"momentum", 2.0}});
    FactorBacktester backtester(momentum_params(2));
    ASSERT_THROWS(backtester.run(bad_return), SchemaError);
}

TEST(backtest_duplicate_row_rejected) {
    ObservationPanel panel;
    panel.add_row(1, "A", 0.01, {{"momentum", 1.0}});
    panel.add_row(1, "A", 0.02, {{"momentum", 2.0}});

    FactorBacktester backtester(momentum_params(2));
    ASSERT_THROWS(backtester.run(panel), ValidationError);
}

TEST(backtest_params_validation) {
    BacktestParams params;
    params.n_buckets = 1;
    ASSERT_THROWS(FactorBacktester(params), ValidationError);

    params.n_buckets = 5;
    params.factor_name.clear();
    ASSERT_THROWS(FactorBacktester(params), ValidationError);
}

// =============================================================================
// DERIVED SERIES TESTS
// =============================================================================

TEST(backtest_long_short_and_stats) {
    const auto returns = sample_returns();
    FactorBacktester backtester(momentum_params(5));
    const BacktestResult result = backtester.run(monotone_panel(returns));

    const ReturnSeries spread = FactorBacktester::long_short_returns(result.bucket_returns, 5, 1);
    ASSERT_TRUE(spread.values.size() == 3);
    for (Eigen::Index t = 0; t < 3; ++t) {
        const auto row = static_cast<size_t>(t);
        ASSERT_NEAR(spread.values(t), returns[row][4] - returns[row][0], 1e-15);
    }

    ASSERT_THROWS(FactorBacktester::long_short_returns(result.bucket_returns, 6, 1), ValidationError);
    ASSERT_THROWS(result.cumulative_bucket(0), ValidationError);

    StatsParams stats_params;
    stats_params.periods_per_year = 12.0;
    const PerformanceStats stats = FactorBacktester::performance_stats(result, 1, stats_params);
    const PerformanceStats direct = stats_from_period_returns(result.bucket_returns.bucket(1).values,
                                                              stats_params);
    ASSERT_NEAR(stats.total_return, direct.total_return, 1e-12);
    ASSERT_NEAR(stats.max_drawdown, direct.max_drawdown, 1e-12);

    // Volatility comes from differenced cumulative values, not the linked inputs
    const PerformanceStats from_cum = stats_from_cumulative(result.cumulative_bucket(1).values,
                                                            stats_params);
    ASSERT_NEAR(stats.annualized_vol, from_cum.annualized_vol, 1e-15);
}

TEST(backtest_composite_returns) {
    const auto returns = sample_returns();
    const ReturnSeries composite = FactorBacktester::composite_returns(monotone_panel(returns));

    ASSERT_TRUE(composite.dates.size() == 3);
    ASSERT_TRUE(composite.dates[0] == 20240131);
    ASSERT_NEAR(composite.values(0), 0.1 / 5.0, 1e-15);
    ASSERT_NEAR(composite.values(1), 0.0, 1e-15);
    ASSERT_NEAR(composite.values(2), 0.11 / 5.0, 1e-15);
}

TEST(backtest_aggregate_empty_cell_is_nan) {
    const std::vector<Date> dates = {1, 1, 2};
    const std::vector<double> rets = {0.01, 0.03, 0.05};
    const std::vector<int> buckets = {1, 1, 2};

    const BucketReturns br = FactorBacktester::aggregate(dates, rets, buckets, 2);
    ASSERT_NEAR(br.returns(0, 0), 0.02, 1e-15);
    ASSERT_TRUE(std::isnan(br.returns(0, 1)));
    ASSERT_TRUE(std::isnan(br.returns(1, 0)));
    ASSERT_TRUE(br.counts(1, 1) == 1);

    const std::vector<int> out_of_range = {1, 3, 2};
    ASSERT_THROWS(FactorBacktester::aggregate(dates, rets, out_of_range, 2), ValidationError);
}

TEST(backtest_profiling) {
    FactorBacktester backtester(momentum_params(5));
    const ObservationPanel panel = monotone_panel(sample_returns());

    (void)backtester.run(panel);
    (void)backtester.run(panel);
    ASSERT_TRUE(backtester.avg_latency_ns() >= 0.0);

    backtester.reset_profiling();
    ASSERT_TRUE(backtester.last_latency_ns() == 0);
    ASSERT_TRUE(backtester.avg_latency_ns() == 0.0);
}

// =============================================================================
// FACTOR SCORE TESTS
// =============================================================================

TEST(z_scores_population) {
    Eigen::VectorXd values(3);
    values << 1.0, 2.0, 3.0;
    const Eigen::VectorXd z = z_scores(values);
    ASSERT_NEAR(z(0), -1.224744871391589, 1e-12);
    ASSERT_NEAR(z(1), 0.0, 1e-15);
    ASSERT_NEAR(z(2), 1.224744871391589, 1e-12);

    values << 1.0, kNaN, 3.0;
    const Eigen::VectorXd with_gap = z_scores(values);
    ASSERT_NEAR(with_gap(0), -1.0, 1e-12);
    ASSERT_TRUE(std::isnan(with_gap(1)));
    ASSERT_NEAR(with_gap(2), 1.0, 1e-12);

    const Eigen::VectorXd flat = z_scores(Eigen::VectorXd::Constant(4, 0.5));
    ASSERT_TRUE(std::isnan(flat(0)) && std::isnan(flat(3)));
}

TEST(factor_scores_composites) {
    const std::vector<Fundamentals> universe = {
        Fundamentals(10.0, 1.0, 5.0, 0.20, 0.2),
        Fundamentals(20.0, 2.0, 10.0, 0.10, 0.8),
        Fundamentals(0.0, 4.0, 8.0, 0.15, 0.5),
    };

    const std::vector<FactorScores> scores = compute_factor_scores(universe);
    ASSERT_TRUE(scores.size() == 3);

    ASSERT_NEAR(scores[0].earnings_yield, 0.1, 1e-15);
    ASSERT_NEAR(scores[1].book_to_market, 0.5, 1e-15);
    ASSERT_NEAR(scores[0].ev_ebitda_inverse, 0.2, 1e-15);
    ASSERT_TRUE(std::isnan(scores[2].earnings_yield));

    // Cheapest, most profitable, least levered name wins on both legs
    ASSERT_TRUE(scores[0].value_score > scores[1].value_score);
    ASSERT_TRUE(scores[0].quality_score > scores[1].quality_score);
    ASSERT_TRUE(scores[0].vq_score > scores[1].vq_score);

    for (const auto& s : scores) {
        ASSERT_TRUE(std::isfinite(s.value_score));
        ASSERT_NEAR(s.vq_score, (s.value_score + s.quality_score) / 2.0, 1e-15);
    }
}

TEST(factor_scores_validation) {
    ASSERT_THROWS(compute_factor_scores({}), ValidationError);

    const std::vector<Fundamentals> bad = {
        Fundamentals(10.0, 1.0, 5.0, kNaN, 0.2),
    };
    ASSERT_THROWS(compute_factor_scores(bad), ValidationError);
}

// =============================================================================
// SUITE
// =============================================================================

void run_backtester_tests() {
    RUN_TEST(backtest_single_entity_buckets_compound_directly);
    RUN_TEST(backtest_bucket_means_and_counts);
    RUN_TEST(backtest_missing_factor_rows_excluded);
    RUN_TEST(backtest_skip_undersized_dates);
    RUN_TEST(backtest_schema_errors_fail_fast);
    RUN_TEST(backtest_duplicate_row_rejected);
    RUN_TEST(backtest_params_validation);
    RUN_TEST(backtest_long_short_and_stats);
    RUN_TEST(backtest_composite_returns);
    RUN_TEST(backtest_aggregate_empty_cell_is_nan);
    RUN_TEST(backtest_profiling);
    RUN_TEST(z_scores_population);
    RUN_TEST(factor_scores_composites);
    RUN_TEST(factor_scores_validation);
}
