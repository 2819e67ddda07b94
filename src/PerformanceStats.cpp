/**
 * @file PerformanceStats.cpp
 * @brief Implementation of the performance statistics engine
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#include "factorlab/PerformanceStats.hpp"
#include "factorlab/Errors.hpp"
#include "factorlab/Logging.hpp"
#include "factorlab/NumericUtils.hpp"
#include "factorlab/ReturnLinker.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace factorlab {

void StatsParams::validate() const {
    if (!(periods_per_year > 0.0) || !std::isfinite(periods_per_year)) {
        throw ValidationError("periods_per_year must be positive, got " +
                              std::to_string(periods_per_year));
    }
    if (!std::isfinite(risk_free_rate)) {
        throw ValidationError("risk_free_rate must be finite");
    }
}

// =============================================================================
// BUILDING BLOCKS
// =============================================================================

double annualized_return(double total_return, Eigen::Index n_periods, double periods_per_year) {
    if (n_periods <= 0) {
        throw ValidationError("annualized_return: n_periods must be positive");
    }
    return std::pow(1.0 + total_return, periods_per_year / static_cast<double>(n_periods)) - 1.0;
}

double max_drawdown(const Eigen::Ref<const Eigen::VectorXd>& cumulative) {
    if (cumulative.size() == 0) {
        return 0.0;
    }
    double peak = cumulative(0);
    double worst = 0.0;
    for (Eigen::Index t = 0; t < cumulative.size(); ++t) {
        peak = std::max(peak, cumulative(t));
        worst = std::max(worst, peak - cumulative(t));
    }
    return worst;
}

Eigen::VectorXd period_returns_from_cumulative(const Eigen::Ref<const Eigen::VectorXd>& cumulative) {
    Eigen::VectorXd period(cumulative.size());
    if (cumulative.size() == 0) {
        return period;
    }
    period(0) = cumulative(0);
    for (Eigen::Index t = 1; t < cumulative.size(); ++t) {
        period(t) = cumulative(t) - cumulative(t - 1);
    }
    return period;
}

namespace {

// Shared tail of both entry points once total return, period returns and the
// drawdown series are known.
PerformanceStats summarize(double total_return,
                           const Eigen::Ref<const Eigen::VectorXd>& period_returns,
                           const Eigen::Ref<const Eigen::VectorXd>& cumulative,
                           const StatsParams& params) {
    const double ppy = params.periods_per_year;

    PerformanceStats stats;
    stats.total_return = total_return;
    stats.annualized_return = annualized_return(total_return, period_returns.size(), ppy);
    stats.annualized_vol = population_std(period_returns) * std::sqrt(ppy);

    const double annualized_rf = std::pow(1.0 + params.risk_free_rate, ppy) - 1.0;
    if (stats.annualized_vol == 0.0) {
        stats.sharpe = std::numeric_limits<double>::quiet_NaN();
    } else {
        stats.sharpe = (stats.annualized_return - annualized_rf) / stats.annualized_vol;
    }

    stats.max_drawdown = max_drawdown(cumulative);

    logger()->debug("stats n={} total={:.6f} ann={:.6f} vol={:.6f} sharpe={:.4f} mdd={:.6f}",
                    period_returns.size(), stats.total_return, stats.annualized_return,
                    stats.annualized_vol, stats.sharpe, stats.max_drawdown);
    return stats;
}

} // namespace

// =============================================================================
// ENTRY POINTS
// =============================================================================

PerformanceStats stats_from_period_returns(const Eigen::Ref<const Eigen::VectorXd>& period_returns,
                                           const StatsParams& params) {
    params.validate();
    require_non_empty(period_returns, "stats_from_period_returns");
    require_finite(period_returns, "stats_from_period_returns");

    const Eigen::VectorXd cumulative = link_returns(period_returns);
    return summarize(cumulative(cumulative.size() - 1), period_returns, cumulative, params);
}

PerformanceStats stats_from_cumulative(const Eigen::Ref<const Eigen::VectorXd>& cumulative,
                                       const StatsParams& params) {
    params.validate();
    require_non_empty(cumulative, "stats_from_cumulative");
    require_finite(cumulative, "stats_from_cumulative");

    const Eigen::VectorXd period = period_returns_from_cumulative(cumulative);
    return summarize(cumulative(cumulative.size() - 1), period, cumulative, params);
}

// =============================================================================
// TAIL RISK
// =============================================================================

double historical_var(const Eigen::Ref<const Eigen::VectorXd>& period_returns, double confidence) {
    if (!(confidence > 0.0 && confidence < 1.0)) {
        throw ValidationError("confidence must lie in (0, 1), got " + std::to_string(confidence));
    }
    if (period_returns.size() == 0) {
        return 0.0;
    }
    require_finite(period_returns, "historical_var");
    return percentile(period_returns, (1.0 - confidence) * 100.0);
}

double expected_shortfall(const Eigen::Ref<const Eigen::VectorXd>& period_returns, double confidence) {
    const double var = historical_var(period_returns, confidence);
    if (period_returns.size() == 0) {
        return 0.0;
    }

    double sum = 0.0;
    Eigen::Index count = 0;
    for (Eigen::Index i = 0; i < period_returns.size(); ++i) {
        if (period_returns(i) <= var) {
            sum += period_returns(i);
            ++count;
        }
    }
    // The minimum is always <= the interpolated percentile, so count >= 1
    return sum / static_cast<double>(count);
}

} // namespace factorlab
