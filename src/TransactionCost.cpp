/**
 * @file TransactionCost.cpp
 * @brief Closed-form transaction cost estimators
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#include "factorlab/TransactionCost.hpp"
#include "factorlab/Errors.hpp"
#include <cmath>
#include <string>

namespace factorlab {

void SqrtImpactParams::validate() const {
    if (!std::isfinite(k) || k < 0.0) {
        throw ValidationError("impact constant k must be finite and >= 0, got " + std::to_string(k));
    }
    if (!std::isfinite(daily_vol) || daily_vol < 0.0) {
        throw ValidationError("daily_vol must be finite and >= 0, got " + std::to_string(daily_vol));
    }
}

void AlmgrenChrissParams::validate() const {
    if (!std::isfinite(permanent_cost_per_share) || !std::isfinite(eta)) {
        throw ValidationError("Almgren-Chriss coefficients must be finite");
    }
    if (!std::isfinite(time_horizon) || time_horizon <= 0.0) {
        throw ValidationError("time_horizon must be > 0, got " + std::to_string(time_horizon));
    }
}

// =============================================================================
// SQUARE-ROOT IMPACT
// =============================================================================

namespace {

inline double signum(double v) noexcept {
    return static_cast<double>((0.0 < v) - (v < 0.0));
}

inline double impact(double v, double scale) noexcept {
    return scale * std::sqrt(std::abs(v)) * signum(v);
}

} // namespace

double sqrt_impact_cost(double trade_fraction, const SqrtImpactParams& params) {
    params.validate();
    return impact(trade_fraction, params.k * params.daily_vol);
}

Eigen::VectorXd sqrt_impact(const Eigen::Ref<const Eigen::VectorXd>& trade_fractions,
                            const SqrtImpactParams& params) {
    params.validate();
    const double scale = params.k * params.daily_vol;

    Eigen::VectorXd costs(trade_fractions.size());
    for (Eigen::Index i = 0; i < trade_fractions.size(); ++i) {
        costs(i) = impact(trade_fractions(i), scale);
    }
    return costs;
}

// =============================================================================
// ALMGREN-CHRISS
// =============================================================================

double almgren_chriss_cost(double shares, const AlmgrenChrissParams& params) {
    params.validate();
    return params.permanent_cost_per_share * shares + params.eta * shares / params.time_horizon;
}

Eigen::VectorXd almgren_chriss(const Eigen::Ref<const Eigen::VectorXd>& shares,
                               const AlmgrenChrissParams& params) {
    params.validate();

    // Permanent (linear) + temporary (urgency) terms
    return (params.permanent_cost_per_share * shares.array()
          + params.eta * shares.array() / params.time_horizon).matrix();
}

} // namespace factorlab
