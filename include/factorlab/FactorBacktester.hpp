/**
 * @file FactorBacktester.hpp
 * @brief Cross-sectional quantile factor backtester
 *
 * FactorLab - Backtest Loop
 *
 * Pipeline for one run:
 * 1. Validate the panel schema (fail fast, nothing is computed on error)
 * 2. Bucket every date by the chosen factor (bucket 1 = lowest factor)
 * 3. Average realized returns per (date, bucket) -> bucket return matrix
 * 4. Geometrically link each bucket column -> cumulative returns
 *
 * Dates are sorted internally; the input panel can be in any row order.
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#pragma once

#include "factorlab/Panel.hpp"
#include "factorlab/PerformanceStats.hpp"
#include "factorlab/QuantileBucketer.hpp"
#include <Eigen/Dense>
#include <cstdint>
#include <string>
#include <vector>

namespace factorlab {

/**
 * @brief Backtest configuration
 */
struct BacktestParams {
    std::string factor_name = "factor";  // Panel column used for ranking
    int n_buckets = 5;
    bool skip_undersized_dates = false;  // Drop dates with < n_buckets rankable rows

    /**
     * @throws ValidationError if n_buckets < 2 or factor_name is empty
     */
    void validate() const;

    [[nodiscard]] BucketerParams bucketer_params() const;
};

/**
 * @brief Date-indexed return series
 */
struct ReturnSeries {
    std::vector<Date> dates;
    Eigen::VectorXd values;
};

/**
 * @brief Per-bucket period returns
 *
 * returns(t, b) is the mean realized return of bucket b+1 on dates[t];
 * counts(t, b) is the number of entities behind it. Dates ascend.
 */
struct BucketReturns {
    std::vector<Date> dates;
    Eigen::MatrixXd returns;
    Eigen::MatrixXi counts;

    [[nodiscard]] int n_buckets() const noexcept { return static_cast<int>(returns.cols()); }

    /**
     * @brief Period returns of one bucket (1-based)
     * @throws ValidationError if bucket is out of range
     */
    [[nodiscard]] ReturnSeries bucket(int bucket_index) const;
};

/**
 * @brief Output of one backtest run
 */
struct BacktestResult {
    std::vector<int> assignments;   // Bucket per panel row, kUnassigned if none
    BucketReturns bucket_returns;
    Eigen::MatrixXd cumulative;     // Same shape as bucket_returns.returns
    int64_t latency_ns;

    BacktestResult() : latency_ns(0) {}

    /**
     * @brief Cumulative series of one bucket (1-based)
     * @throws ValidationError if bucket is out of range
     */
    [[nodiscard]] ReturnSeries cumulative_bucket(int bucket_index) const;
};

/**
 * @brief Quantile factor backtester
 */
class FactorBacktester {
public:
    /**
     * @brief Construct with default parameters (factor "factor", 5 buckets)
     */
    FactorBacktester();

    /**
     * @brief Construct with custom parameters
     * @throws ValidationError if params are invalid
     */
    explicit FactorBacktester(const BacktestParams& params);

    /**
     * @brief Run the backtest over a panel
     *
     * @throws SchemaError if the factor column is missing, columns are ragged
     *         or a realized return is not finite
     * @throws ValidationError on a duplicated (date, entity_id)
     * @throws CardinalityError if a date cannot fill every bucket and
     *         skip_undersized_dates is off
     */
    [[nodiscard]] BacktestResult run(const ObservationPanel& panel);

    /**
     * @brief Statistics of one bucket's cumulative series
     */
    [[nodiscard]] static PerformanceStats performance_stats(const BacktestResult& result, int bucket,
                                                            const StatsParams& params = StatsParams{});

    /**
     * @brief Mean realized return per (date, bucket)
     *
     * @param dates Date per row
     * @param realized_returns Return per row
     * @param assignments Bucket per row (kUnassigned rows are ignored)
     * @param n_buckets Number of buckets
     */
    [[nodiscard]] static BucketReturns aggregate(const std::vector<Date>& dates,
                                                 const std::vector<double>& realized_returns,
                                                 const std::vector<int>& assignments,
                                                 int n_buckets);

    /**
     * @brief Per-date long/short spread: returns(long) - returns(short)
     * @throws ValidationError if either bucket is out of range
     */
    [[nodiscard]] static ReturnSeries long_short_returns(const BucketReturns& bucket_returns,
                                                         int long_bucket, int short_bucket);

    /**
     * @brief Equal-weighted mean realized return of all rows per date
     *
     * Composite series for GIPS-style reporting.
     */
    [[nodiscard]] static ReturnSeries composite_returns(const ObservationPanel& panel);

    [[nodiscard]] const BacktestParams& params() const noexcept { return params_; }

    [[nodiscard]] int64_t last_latency_ns() const noexcept { return last_latency_ns_; }

    /**
     * @brief Average latency over all runs
     */
    [[nodiscard]] double avg_latency_ns() const noexcept;

    /**
     * @brief Reset profiling statistics
     */
    void reset_profiling() noexcept;

private:
    BacktestParams params_;
    QuantileBucketer bucketer_;

    // Profiling
    int64_t last_latency_ns_;
    int64_t total_latency_ns_;
    size_t run_count_;
};

} // namespace factorlab
