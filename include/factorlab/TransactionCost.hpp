/**
 * @file TransactionCost.hpp
 * @brief Closed-form transaction cost estimators
 *
 * FactorLab - Execution Cost Models
 *
 * Two independent element-wise models:
 *
 * 1. Square-root market impact
 *      cost(v) = k * daily_vol * sqrt(|v|) * sign(v)
 *    v is the signed trade size as a fraction of average daily volume. The
 *    sign of the cost follows the trade direction.
 *
 * 2. Almgren-Chriss temporary cost
 *      cost(s) = permanent_cost_per_share * s + eta * s / time_horizon
 *    s is a share count. A shorter horizon raises the temporary term.
 *
 * No aggregation or netting is done here; outputs are parallel to inputs.
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#pragma once

#include <Eigen/Dense>

namespace factorlab {

/**
 * @brief Square-root impact calibration
 */
struct SqrtImpactParams {
    double k = 0.1;              // Calibration constant
    double daily_vol = 0.02;     // Asset's realized daily volatility

    /**
     * @throws ValidationError if k or daily_vol is negative or not finite
     */
    void validate() const;
};

/**
 * @brief Almgren-Chriss cost parameters
 *
 * Both coefficients are calibration inputs with no meaningful default, so
 * they must be passed at construction.
 */
struct AlmgrenChrissParams {
    double permanent_cost_per_share;  // Linear permanent-impact baseline
    double eta;                       // Temporary-impact coefficient
    double time_horizon;              // Execution horizon, must be > 0

    AlmgrenChrissParams(double permanent_cost, double temporary_eta, double horizon = 1.0)
        : permanent_cost_per_share(permanent_cost)
        , eta(temporary_eta)
        , time_horizon(horizon) {}

    /**
     * @throws ValidationError if time_horizon <= 0 or any field is not finite
     */
    void validate() const;
};

/**
 * @brief Square-root impact cost of one trade
 */
[[nodiscard]] double sqrt_impact_cost(double trade_fraction,
                                      const SqrtImpactParams& params = SqrtImpactParams{});

/**
 * @brief Square-root impact cost per trade
 *
 * @param trade_fractions Signed trade sizes as fractions of ADV
 */
[[nodiscard]] Eigen::VectorXd sqrt_impact(const Eigen::Ref<const Eigen::VectorXd>& trade_fractions,
                                          const SqrtImpactParams& params = SqrtImpactParams{});

/**
 * @brief Almgren-Chriss cost of one trade
 * @throws ValidationError if params.time_horizon <= 0
 */
[[nodiscard]] double almgren_chriss_cost(double shares, const AlmgrenChrissParams& params);

/**
 * @brief Almgren-Chriss cost per trade
 * @throws ValidationError if params.time_horizon <= 0
 */
[[nodiscard]] Eigen::VectorXd almgren_chriss(const Eigen::Ref<const Eigen::VectorXd>& shares,
                                             const AlmgrenChrissParams& params);

} // namespace factorlab
