/**
 * @file FactorBacktester.cpp
 * @brief Implementation of the quantile factor backtester
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#include "factorlab/FactorBacktester.hpp"
#include "factorlab/Errors.hpp"
#include "factorlab/Logging.hpp"
#include "factorlab/ReturnLinker.hpp"
#include <chrono>
#include <cmath>
#include <limits>
#include <map>

namespace factorlab {

namespace {

const BacktestParams& checked(const BacktestParams& params) {
    params.validate();
    return params;
}

void require_bucket(int bucket_index, Eigen::Index n_buckets) {
    if (bucket_index < 1 || bucket_index > n_buckets) {
        throw ValidationError("bucket " + std::to_string(bucket_index) + " out of range [1, " +
                              std::to_string(n_buckets) + "]");
    }
}

} // namespace

// =============================================================================
// PARAMETERS & RESULT ACCESSORS
// =============================================================================

void BacktestParams::validate() const {
    if (factor_name.empty()) {
        throw ValidationError("factor_name must not be empty");
    }
    bucketer_params().validate();
}

BucketerParams BacktestParams::bucketer_params() const {
    BucketerParams bp;
    bp.n_buckets = n_buckets;
    bp.skip_undersized_dates = skip_undersized_dates;
    return bp;
}

ReturnSeries BucketReturns::bucket(int bucket_index) const {
    require_bucket(bucket_index, returns.cols());
    return ReturnSeries{dates, returns.col(bucket_index - 1)};
}

ReturnSeries BacktestResult::cumulative_bucket(int bucket_index) const {
    require_bucket(bucket_index, cumulative.cols());
    return ReturnSeries{bucket_returns.dates, cumulative.col(bucket_index - 1)};
}

// =============================================================================
// CONSTRUCTION
// =============================================================================

FactorBacktester::FactorBacktester()
    : FactorBacktester(BacktestParams{}) {}

FactorBacktester::FactorBacktester(const BacktestParams& params)
    : params_(checked(params))
    , bucketer_(params.bucketer_params())
    , last_latency_ns_(0)
    , total_latency_ns_(0)
    , run_count_(0)
{}

// =============================================================================
// BACKTEST RUN
// =============================================================================

BacktestResult FactorBacktester::run(const ObservationPanel& panel) {
    const auto start = std::chrono::high_resolution_clock::now();

    // Step 1: schema checks before any computation
    panel.validate(params_.factor_name);

    BacktestResult result;

    // Step 2: per-date buckets
    result.assignments = bucketer_.assign(panel, params_.factor_name);

    // Step 3: (date, bucket) means, ascending dates
    result.bucket_returns = aggregate(panel.dates(), panel.realized_returns(),
                                      result.assignments, params_.n_buckets);

    // Step 4: compound each bucket
    result.cumulative = link_returns_columnwise(result.bucket_returns.returns);

    const auto end = std::chrono::high_resolution_clock::now();
    last_latency_ns_ = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    total_latency_ns_ += last_latency_ns_;
    ++run_count_;
    result.latency_ns = last_latency_ns_;

    logger()->debug("backtest '{}': rows={} dates={} buckets={} latency_ns={}",
                    params_.factor_name, panel.size(), result.bucket_returns.dates.size(),
                    params_.n_buckets, result.latency_ns);
    return result;
}

PerformanceStats FactorBacktester::performance_stats(const BacktestResult& result, int bucket,
                                                     const StatsParams& params) {
    return stats_from_cumulative(result.cumulative_bucket(bucket).values, params);
}

// =============================================================================
// AGGREGATION
// =============================================================================

BucketReturns FactorBacktester::aggregate(const std::vector<Date>& dates,
                                          const std::vector<double>& realized_returns,
                                          const std::vector<int>& assignments,
                                          int n_buckets) {
    if (dates.size() != realized_returns.size() || dates.size() != assignments.size()) {
        throw SchemaError("aggregate: dates, returns and assignments differ in length");
    }
    if (n_buckets < 1) {
        throw ValidationError("aggregate: n_buckets must be positive");
    }

    // Row position of each date that has at least one assigned row
    std::map<Date, Eigen::Index> date_rows;
    for (size_t i = 0; i < dates.size(); ++i) {
        if (assignments[i] != kUnassigned) {
            date_rows.emplace(dates[i], 0);
        }
    }

    BucketReturns out;
    out.dates.reserve(date_rows.size());
    Eigen::Index row = 0;
    for (auto& [date, pos] : date_rows) {
        pos = row++;
        out.dates.push_back(date);
    }

    const auto T = static_cast<Eigen::Index>(date_rows.size());
    Eigen::MatrixXd sums = Eigen::MatrixXd::Zero(T, n_buckets);
    out.counts = Eigen::MatrixXi::Zero(T, n_buckets);

    for (size_t i = 0; i < dates.size(); ++i) {
        const int b = assignments[i];
        if (b == kUnassigned) {
            continue;
        }
        if (b < 1 || b > n_buckets) {
            throw ValidationError("aggregate: bucket " + std::to_string(b) + " at row " +
                                  std::to_string(i) + " out of range");
        }
        const Eigen::Index t = date_rows.at(dates[i]);
        sums(t, b - 1) += realized_returns[i];
        out.counts(t, b - 1) += 1;
    }

    out.returns.resize(T, n_buckets);
    for (Eigen::Index t = 0; t < T; ++t) {
        for (Eigen::Index b = 0; b < n_buckets; ++b) {
            const int count = out.counts(t, b);
            out.returns(t, b) = count > 0
                ? sums(t, b) / static_cast<double>(count)
                : std::numeric_limits<double>::quiet_NaN();
        }
    }
    return out;
}

ReturnSeries FactorBacktester::long_short_returns(const BucketReturns& bucket_returns,
                                                  int long_bucket, int short_bucket) {
    require_bucket(long_bucket, bucket_returns.returns.cols());
    require_bucket(short_bucket, bucket_returns.returns.cols());

    return ReturnSeries{
        bucket_returns.dates,
        bucket_returns.returns.col(long_bucket - 1) - bucket_returns.returns.col(short_bucket - 1)
    };
}

ReturnSeries FactorBacktester::composite_returns(const ObservationPanel& panel) {
    const auto& dates = panel.dates();
    const auto& returns = panel.realized_returns();
    if (dates.size() != returns.size()) {
        throw SchemaError("composite_returns: dates and realized_return differ in length");
    }

    std::map<Date, std::pair<double, size_t>> by_date;
    for (size_t i = 0; i < dates.size(); ++i) {
        if (!std::isfinite(returns[i])) {
            throw SchemaError("realized_return is not finite at row " + std::to_string(i));
        }
        auto& [sum, count] = by_date[dates[i]];
        sum += returns[i];
        ++count;
    }

    ReturnSeries series;
    series.dates.reserve(by_date.size());
    series.values.resize(static_cast<Eigen::Index>(by_date.size()));
    Eigen::Index t = 0;
    for (const auto& [date, acc] : by_date) {
        series.dates.push_back(date);
        series.values(t++) = acc.first / static_cast<double>(acc.second);
    }
    return series;
}

// =============================================================================
// PROFILING
// =============================================================================

double FactorBacktester::avg_latency_ns() const noexcept {
    if (run_count_ == 0) return 0.0;
    return static_cast<double>(total_latency_ns_) / static_cast<double>(run_count_);
}

void FactorBacktester::reset_profiling() noexcept {
    last_latency_ns_ = 0;
    total_latency_ns_ = 0;
    run_count_ = 0;
}

} // namespace factorlab
