/**
 * @file QuantileBucketer.cpp
 * @brief Implementation of cross-sectional quantile bucketing
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#include "factorlab/QuantileBucketer.hpp"
#include "factorlab/Errors.hpp"
#include "factorlab/Logging.hpp"
#include <algorithm>
#include <cmath>
#include <map>

namespace factorlab {

void BucketerParams::validate() const {
    if (n_buckets < 2) {
        throw ValidationError("n_buckets must be >= 2, got " + std::to_string(n_buckets));
    }
}

// =============================================================================
// CONSTRUCTION
// =============================================================================

QuantileBucketer::QuantileBucketer()
    : QuantileBucketer(BucketerParams{}) {}

QuantileBucketer::QuantileBucketer(const BucketerParams& params)
    : params_(params)
    , last_latency_ns_(0)
{
    params_.validate();
}

// =============================================================================
// PARTITIONING
// =============================================================================

std::vector<size_t> QuantileBucketer::partition_sizes(size_t n, int n_buckets) {
    if (n_buckets < 1) {
        throw ValidationError("n_buckets must be positive, got " + std::to_string(n_buckets));
    }
    const auto buckets = static_cast<size_t>(n_buckets);
    const size_t base = n / buckets;
    const size_t remainder = n % buckets;

    std::vector<size_t> sizes(buckets, base);
    for (size_t b = 0; b < remainder; ++b) {
        ++sizes[b];
    }
    return sizes;
}

// =============================================================================
// ASSIGNMENT
// =============================================================================

std::vector<int> QuantileBucketer::assign(const std::vector<Date>& dates,
                                          const std::vector<double>& factor_values) const {
    const auto start = std::chrono::high_resolution_clock::now();

    if (dates.size() != factor_values.size()) {
        throw SchemaError("bucketer: " + std::to_string(dates.size()) + " dates but " +
                          std::to_string(factor_values.size()) + " factor values");
    }

    // Rankable row indices per date, in first-seen order
    std::map<Date, std::vector<size_t>> rows_by_date;
    for (size_t i = 0; i < dates.size(); ++i) {
        if (std::isnan(factor_values[i])) {
            rows_by_date[dates[i]];  // date still has to be checked for cardinality
            continue;
        }
        rows_by_date[dates[i]].push_back(i);
    }

    std::vector<int> buckets(dates.size(), kUnassigned);
    const auto n_buckets = static_cast<size_t>(params_.n_buckets);

    for (auto& [date, rows] : rows_by_date) {
        if (rows.size() < n_buckets) {
            if (params_.skip_undersized_dates) {
                logger()->warn("skipping date {}: {} rankable rows for {} buckets",
                               date, rows.size(), n_buckets);
                continue;
            }
            throw CardinalityError("date " + std::to_string(date) + " has " +
                                   std::to_string(rows.size()) + " rankable rows, need " +
                                   std::to_string(n_buckets), date);
        }

        // Stable sort keeps first-seen order among equal factor values
        std::stable_sort(rows.begin(), rows.end(), [&](size_t a, size_t b) {
            return factor_values[a] < factor_values[b];
        });

        const std::vector<size_t> sizes = partition_sizes(rows.size(), params_.n_buckets);
        size_t pos = 0;
        for (size_t b = 0; b < sizes.size(); ++b) {
            for (size_t k = 0; k < sizes[b]; ++k, ++pos) {
                buckets[rows[pos]] = static_cast<int>(b) + 1;
            }
        }
    }

    const auto end = std::chrono::high_resolution_clock::now();
    last_latency_ns_ = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();

    return buckets;
}

std::vector<int> QuantileBucketer::assign(const ObservationPanel& panel,
                                          const std::string& factor_name) const {
    return assign(panel.dates(), panel.factor(factor_name));
}

} // namespace factorlab
