/**
 * @file NumericUtils.cpp
 * @brief Shared numeric helpers and input validation
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#include "factorlab/NumericUtils.hpp"
#include "factorlab/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace factorlab {

// =============================================================================
// VALIDATION
// =============================================================================

void require_finite(const Eigen::Ref<const Eigen::MatrixXd>& values, const std::string& what) {
    for (Eigen::Index j = 0; j < values.cols(); ++j) {
        for (Eigen::Index i = 0; i < values.rows(); ++i) {
            if (!std::isfinite(values(i, j))) {
                throw ValidationError(what + ": non-finite value at (" +
                                      std::to_string(i) + ", " + std::to_string(j) + ")");
            }
        }
    }
}

void require_non_empty(const Eigen::Ref<const Eigen::VectorXd>& values, const std::string& what) {
    if (values.size() == 0) {
        throw ValidationError(what + ": series is empty");
    }
}

// =============================================================================
// MOMENTS
// =============================================================================

double population_std(const Eigen::Ref<const Eigen::VectorXd>& values) {
    if (values.size() == 0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    // Identical values: report exact zero rather than rounding noise from the mean
    if (values.maxCoeff() == values.minCoeff()) {
        return 0.0;
    }
    const double mean = values.mean();
    const double variance = (values.array() - mean).square().mean();
    return std::sqrt(variance);
}

double nan_mean(const Eigen::Ref<const Eigen::VectorXd>& values) {
    double sum = 0.0;
    Eigen::Index count = 0;
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        if (std::isfinite(values(i))) {
            sum += values(i);
            ++count;
        }
    }
    if (count == 0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return sum / static_cast<double>(count);
}

Eigen::MatrixXd sample_covariance(const Eigen::MatrixXd& returns) {
    const Eigen::Index T = returns.rows();
    if (T < 2) {
        throw ValidationError("sample_covariance: need at least 2 observations, got " +
                              std::to_string(T));
    }

    // Center the returns (subtract mean)
    Eigen::RowVectorXd means = returns.colwise().mean();
    Eigen::MatrixXd centered = returns.rowwise() - means;

    // C = X'X / (T-1)
    return (centered.transpose() * centered) / static_cast<double>(T - 1);
}

// =============================================================================
// LINEAR ALGEBRA
// =============================================================================

Eigen::MatrixXd pseudo_inverse(const Eigen::MatrixXd& m, double rcond) {
    if (m.size() == 0) {
        return Eigen::MatrixXd(m.cols(), m.rows());
    }

    Eigen::JacobiSVD<Eigen::MatrixXd> svd(m, Eigen::ComputeThinU | Eigen::ComputeThinV);
    const Eigen::VectorXd& singular = svd.singularValues();

    const double cutoff = rcond * singular.maxCoeff();
    Eigen::VectorXd inv_singular = Eigen::VectorXd::Zero(singular.size());
    for (Eigen::Index i = 0; i < singular.size(); ++i) {
        if (singular(i) > cutoff) {
            inv_singular(i) = 1.0 / singular(i);
        }
    }

    // A+ = V * S+ * U'
    return svd.matrixV() * inv_singular.asDiagonal() * svd.matrixU().transpose();
}

// =============================================================================
// ORDER STATISTICS
// =============================================================================

double percentile(const Eigen::Ref<const Eigen::VectorXd>& values, double q) {
    if (values.size() == 0) {
        throw ValidationError("percentile: series is empty");
    }
    if (!(q >= 0.0 && q <= 100.0)) {
        throw ValidationError("percentile: q must lie in [0, 100], got " + std::to_string(q));
    }
    // NaN breaks the sort's strict weak ordering
    require_finite(values, "percentile");

    std::vector<double> sorted(values.data(), values.data() + values.size());
    std::sort(sorted.begin(), sorted.end());

    const double pos = q / 100.0 * static_cast<double>(sorted.size() - 1);
    const auto lo = static_cast<size_t>(std::floor(pos));
    const auto hi = static_cast<size_t>(std::ceil(pos));
    const double frac = pos - static_cast<double>(lo);

    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

} // namespace factorlab
