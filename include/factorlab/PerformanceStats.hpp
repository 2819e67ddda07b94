/**
 * @file PerformanceStats.hpp
 * @brief Period and annualized performance statistics
 *
 * FactorLab - Performance Statistics Engine
 *
 * Definitions (n = number of period returns, P = periods per year):
 *   total_return      = prod(1 + r) - 1
 *   annualized_return = (1 + total_return)^(P / n) - 1
 *   annualized_vol    = std_pop(r) * sqrt(P)
 *   sharpe            = (annualized_return - ((1 + rf)^P - 1)) / annualized_vol
 *                       NaN when annualized_vol == 0
 *   max_drawdown      = max_t (max_{s<=t} cum(s) - cum(t)), always >= 0
 *
 * Drawdown is measured in cumulative-return units, not as a fraction of the
 * running peak's wealth.
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#pragma once

#include <Eigen/Dense>

namespace factorlab {

/**
 * @brief Statistics context
 */
struct StatsParams {
    double periods_per_year = 12.0;  // Monthly by default
    double risk_free_rate = 0.0;     // Per period, same periodicity as the returns

    /**
     * @throws ValidationError if periods_per_year <= 0 or the rate is not finite
     */
    void validate() const;
};

/**
 * @brief Immutable statistics bundle for one return series
 */
struct PerformanceStats {
    double total_return;
    double annualized_return;
    double annualized_vol;
    double sharpe;               // NaN when annualized_vol is exactly zero
    double max_drawdown;

    PerformanceStats()
        : total_return(0.0)
        , annualized_return(0.0)
        , annualized_vol(0.0)
        , sharpe(0.0)
        , max_drawdown(0.0) {}
};

/**
 * @brief Compute statistics from a period-return series (ascending dates)
 *
 * This is the composite / GIPS entry point.
 *
 * @throws ValidationError if the series is empty or non-finite, or params are invalid
 */
[[nodiscard]] PerformanceStats stats_from_period_returns(
    const Eigen::Ref<const Eigen::VectorXd>& period_returns,
    const StatsParams& params = StatsParams{});

/**
 * @brief Compute statistics from a cumulative-return series
 *
 * Period returns are recovered by differencing the cumulative series, the
 * first period taking the first cumulative value. total_return is the last
 * cumulative value and drawdown is measured on the series as given.
 *
 * @throws ValidationError if the series is empty or non-finite, or params are invalid
 */
[[nodiscard]] PerformanceStats stats_from_cumulative(
    const Eigen::Ref<const Eigen::VectorXd>& cumulative,
    const StatsParams& params = StatsParams{});

/**
 * @brief Recover period returns from a cumulative series by differencing
 */
[[nodiscard]] Eigen::VectorXd period_returns_from_cumulative(
    const Eigen::Ref<const Eigen::VectorXd>& cumulative);

/**
 * @brief Geometric annualization of a total return spanning n_periods
 */
[[nodiscard]] double annualized_return(double total_return, Eigen::Index n_periods,
                                       double periods_per_year);

/**
 * @brief Worst peak-to-trough decline of a cumulative series (>= 0)
 */
[[nodiscard]] double max_drawdown(const Eigen::Ref<const Eigen::VectorXd>& cumulative);

/**
 * @brief Historical Value at Risk: the (1 - confidence) percentile of returns
 *
 * Returns 0.0 for an empty series.
 * @throws ValidationError if confidence is outside (0, 1) or a return is not finite
 */
[[nodiscard]] double historical_var(const Eigen::Ref<const Eigen::VectorXd>& period_returns,
                                    double confidence = 0.95);

/**
 * @brief Expected shortfall: mean of returns at or below historical_var()
 *
 * Returns 0.0 for an empty series.
 */
[[nodiscard]] double expected_shortfall(const Eigen::Ref<const Eigen::VectorXd>& period_returns,
                                        double confidence = 0.95);

} // namespace factorlab
