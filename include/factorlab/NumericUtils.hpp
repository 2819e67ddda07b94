/**
 * @file NumericUtils.hpp
 * @brief Shared numeric helpers and input validation
 *
 * Small Eigen-based building blocks used by the statistics engine, the
 * optimizer and the factor scorer.
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <string>

namespace factorlab {

// Default relative cutoff for singular values in pseudo_inverse()
inline constexpr double kDefaultPinvRcond = 1e-15;

// =============================================================================
// VALIDATION
// =============================================================================

/**
 * @brief Throw ValidationError unless every entry is finite
 *
 * @param what Name used in the error message
 */
void require_finite(const Eigen::Ref<const Eigen::MatrixXd>& values, const std::string& what);

/**
 * @brief Throw ValidationError if the series has no observations
 */
void require_non_empty(const Eigen::Ref<const Eigen::VectorXd>& values, const std::string& what);

// =============================================================================
// MOMENTS
// =============================================================================

/**
 * @brief Population standard deviation (ddof = 0)
 *
 * Returns exactly 0.0 when all values are identical, so callers can test
 * for zero dispersion without a tolerance.
 */
[[nodiscard]] double population_std(const Eigen::Ref<const Eigen::VectorXd>& values);

/**
 * @brief Mean over the finite entries; NaN when there are none
 */
[[nodiscard]] double nan_mean(const Eigen::Ref<const Eigen::VectorXd>& values);

/**
 * @brief Sample covariance matrix (ddof = 1) of a (T x N) matrix
 *
 * @param returns Rows are observations, columns are variables; T >= 2
 * @return (N x N) covariance matrix
 */
[[nodiscard]] Eigen::MatrixXd sample_covariance(const Eigen::MatrixXd& returns);

// =============================================================================
// LINEAR ALGEBRA
// =============================================================================

/**
 * @brief Moore-Penrose pseudo-inverse via SVD
 *
 * Singular values at or below rcond * max(singular value) are treated as
 * zero, so singular and near-singular inputs never fail.
 */
[[nodiscard]] Eigen::MatrixXd pseudo_inverse(const Eigen::MatrixXd& m,
                                             double rcond = kDefaultPinvRcond);

// =============================================================================
// ORDER STATISTICS
// =============================================================================

/**
 * @brief Percentile with linear interpolation between closest ranks
 *
 * @param q Percentile in [0, 100]
 * @throws ValidationError if values is empty or holds a non-finite entry
 */
[[nodiscard]] double percentile(const Eigen::Ref<const Eigen::VectorXd>& values, double q);

// Math utilities (inlined)
inline double clip(double value, double min_val, double max_val) noexcept {
    return std::max(min_val, std::min(max_val, value));
}

} // namespace factorlab
