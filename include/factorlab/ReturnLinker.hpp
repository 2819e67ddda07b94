/**
 * @file ReturnLinker.hpp
 * @brief Geometric linking of period returns
 *
 * cumulative(t) = prod_{i<=t} (1 + r_i) - 1
 *
 * Inputs must already be in ascending date order; nothing here sorts.
 * A period return of exactly -100% pins every later cumulative value at -1.
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#pragma once

#include <Eigen/Dense>
#include <vector>

namespace factorlab {

/**
 * @brief Compound a period-return series into a cumulative-return series
 */
[[nodiscard]] Eigen::VectorXd link_returns(const Eigen::Ref<const Eigen::VectorXd>& period_returns);

[[nodiscard]] std::vector<double> link_returns(const std::vector<double>& period_returns);

/**
 * @brief Link each column of a (T x K) period-return matrix independently
 */
[[nodiscard]] Eigen::MatrixXd link_returns_columnwise(const Eigen::MatrixXd& period_returns);

/**
 * @brief Continue compounding from an existing cumulative value
 *
 * chain_cumulative(link_returns(a).tail(1), b) equals the tail of
 * link_returns(concat(a, b)).
 *
 * @param base_cumulative Cumulative return reached so far
 * @param period_returns Further period returns
 */
[[nodiscard]] Eigen::VectorXd chain_cumulative(double base_cumulative,
                                               const Eigen::Ref<const Eigen::VectorXd>& period_returns);

} // namespace factorlab
