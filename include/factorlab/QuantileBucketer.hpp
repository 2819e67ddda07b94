/**
 * @file QuantileBucketer.hpp
 * @brief Cross-sectional quantile bucket assignment
 *
 * FactorLab - Backtest Loop
 *
 * Each date is ranked independently. Within a date, rows are ordered by
 * ascending factor value with ties broken by first-seen row order, then cut
 * into N contiguous, equal-count groups.
 *
 * Direction convention:
 *   bucket 1 = LOWEST factor values, bucket N = HIGHEST.
 *   Callers who want bucket 1 to be the "best" names must negate the factor
 *   before bucketing.
 *
 * When the row count is not divisible by N, the first (n mod N) buckets take
 * one extra member each.
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#pragma once

#include "factorlab/Panel.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace factorlab {

/// Bucket label of rows with a missing factor or on a skipped date
inline constexpr int kUnassigned = 0;

/**
 * @brief Bucketing parameters
 */
struct BucketerParams {
    int n_buckets = 5;
    bool skip_undersized_dates = false;  // Skip (and log) instead of throwing CardinalityError

    /**
     * @throws ValidationError if n_buckets < 2
     */
    void validate() const;
};

/**
 * @brief Per-date equal-count quantile bucketer
 *
 * assign() is const and its results are safe to compute from several threads
 * on one instance. The latency field is not: every call writes it without
 * synchronization, so use one bucketer per thread when reading
 * last_latency_ns().
 */
class QuantileBucketer {
public:
    /**
     * @brief Construct with default parameters (5 buckets)
     */
    QuantileBucketer();

    /**
     * @brief Construct with custom parameters
     * @throws ValidationError if params are invalid
     */
    explicit QuantileBucketer(const BucketerParams& params);

    /**
     * @brief Assign buckets to parallel (date, factor) columns
     *
     * @param dates Date of each row
     * @param factor_values Factor of each row; NaN marks a missing value
     * @return Bucket in [1, N] per row, or kUnassigned
     *
     * @throws SchemaError if the columns differ in length
     * @throws CardinalityError if a date has fewer than N rankable rows and
     *         skip_undersized_dates is off
     */
    [[nodiscard]] std::vector<int> assign(const std::vector<Date>& dates,
                                          const std::vector<double>& factor_values) const;

    /**
     * @brief Assign buckets using a named factor column of a panel
     */
    [[nodiscard]] std::vector<int> assign(const ObservationPanel& panel,
                                          const std::string& factor_name) const;

    /**
     * @brief Group sizes for n ranked rows split into n_buckets groups
     *
     * Sizes differ by at most one; lower buckets absorb the remainder.
     */
    [[nodiscard]] static std::vector<size_t> partition_sizes(size_t n, int n_buckets);

    [[nodiscard]] const BucketerParams& params() const noexcept { return params_; }

    /**
     * @brief Wall time of the most recent assign() call on this instance
     *
     * Not thread-safe: concurrent assign() calls race on this field.
     */
    [[nodiscard]] int64_t last_latency_ns() const noexcept { return last_latency_ns_; }

private:
    BucketerParams params_;
    mutable int64_t last_latency_ns_;
};

} // namespace factorlab
