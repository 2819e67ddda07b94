/**
 * @file MeanVarianceOptimizer.cpp
 * @brief Implementation of closed-form mean-variance weights
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#include "factorlab/MeanVarianceOptimizer.hpp"
#include "factorlab/Errors.hpp"
#include "factorlab/Logging.hpp"
#include "factorlab/NumericUtils.hpp"
#include <chrono>
#include <cmath>

namespace factorlab {

namespace {
// Below this absolute weight sum the normalizer is treated as zero
constexpr double kDegenerateSum = 1e-12;
}

void OptimizerParams::validate() const {
    if (!(risk_aversion > 0.0) || !std::isfinite(risk_aversion)) {
        throw ValidationError("risk_aversion must be > 0, got " + std::to_string(risk_aversion));
    }
    if (weight_bounds) {
        if (!std::isfinite(weight_bounds->lower) || !std::isfinite(weight_bounds->upper)) {
            throw ValidationError("weight bounds must be finite");
        }
        if (weight_bounds->lower > weight_bounds->upper) {
            throw ValidationError("weight bounds inverted: lower=" +
                                  std::to_string(weight_bounds->lower) +
                                  " upper=" + std::to_string(weight_bounds->upper));
        }
    }
    if (!(pinv_rcond >= 0.0)) {
        throw ValidationError("pinv_rcond must be >= 0");
    }
}

// =============================================================================
// CONSTRUCTION
// =============================================================================

MeanVarianceOptimizer::MeanVarianceOptimizer()
    : MeanVarianceOptimizer(OptimizerParams{}) {}

MeanVarianceOptimizer::MeanVarianceOptimizer(const OptimizerParams& params)
    : params_(params)
    , last_latency_ns_(0)
{
    params_.validate();
}

void MeanVarianceOptimizer::set_params(const OptimizerParams& params) {
    params.validate();
    params_ = params;
}

// =============================================================================
// MAIN OPTIMIZATION
// =============================================================================

OptimizationResult MeanVarianceOptimizer::optimize(const Eigen::MatrixXd& returns) {
    const auto start = std::chrono::high_resolution_clock::now();

    const Eigen::Index T = returns.rows();  // Time periods
    const Eigen::Index N = returns.cols();  // Assets

    if (N < 1) {
        throw ValidationError("optimizer: return matrix has no assets");
    }
    if (T < 2) {
        throw ValidationError("optimizer: need at least 2 observations, got " + std::to_string(T));
    }
    require_finite(returns, "optimizer returns");

    OptimizationResult result;

    // Step 1-2: moments
    result.expected_returns = returns.colwise().mean().transpose();
    result.covariance = sample_covariance(returns);

    // Step 3: raw = pinv(Sigma) * mu / lambda
    const Eigen::MatrixXd inv = pseudo_inverse(result.covariance, params_.pinv_rcond);
    const Eigen::VectorXd raw = inv * (result.expected_returns / params_.risk_aversion);

    // Step 4: normalize to sum to 1
    bool fell_back = false;
    result.weights = normalize(raw, fell_back);
    if (fell_back) {
        logger()->warn("optimizer: raw weights sum to ~0 over {} assets, using equal weights", N);
    }

    // Step 5: optional clip-then-renormalize
    if (params_.weight_bounds) {
        bool clip_fell_back = false;
        result.weights = clip_and_normalize(result.weights, *params_.weight_bounds, &clip_fell_back);
        result.clipped = true;
        fell_back = fell_back || clip_fell_back;
    }
    result.equal_weight_fallback = fell_back;

    const auto end = std::chrono::high_resolution_clock::now();
    result.latency_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    last_latency_ns_ = result.latency_ns;

    logger()->debug("optimizer: T={} N={} clipped={} latency_ns={}",
                    T, N, result.clipped, result.latency_ns);
    return result;
}

// Row-Major overload for zero-copy NumPy integration
std::unordered_map<std::string, double> MeanVarianceOptimizer::optimize_map(
    const Eigen::Ref<const RowMajorMatrixXd>& returns,
    const std::vector<std::string>& symbols
) {
    // Convert to column-major for internal processing
    Eigen::MatrixXd returns_col = returns;
    return optimize_map(returns_col, symbols);
}

std::unordered_map<std::string, double> MeanVarianceOptimizer::optimize_map(
    const Eigen::MatrixXd& returns,
    const std::vector<std::string>& symbols
) {
    if (static_cast<Eigen::Index>(symbols.size()) != returns.cols()) {
        throw ValidationError("optimizer: " + std::to_string(symbols.size()) + " symbols for " +
                              std::to_string(returns.cols()) + " asset columns");
    }

    const OptimizationResult result = optimize(returns);

    std::unordered_map<std::string, double> weight_map;
    for (size_t i = 0; i < symbols.size(); ++i) {
        weight_map[symbols[i]] = result.weights(static_cast<Eigen::Index>(i));
    }
    return weight_map;
}

// =============================================================================
// NORMALIZATION
// =============================================================================

Eigen::VectorXd MeanVarianceOptimizer::normalize(const Eigen::VectorXd& raw, bool& fell_back) {
    const double total = raw.sum();
    if (!std::isfinite(total) || std::abs(total) < kDegenerateSum) {
        fell_back = true;
        return Eigen::VectorXd::Constant(raw.size(), 1.0 / static_cast<double>(raw.size()));
    }
    fell_back = false;
    return raw / total;
}

Eigen::VectorXd MeanVarianceOptimizer::clip_and_normalize(const Eigen::VectorXd& weights,
                                                          const WeightBounds& bounds,
                                                          bool* fell_back) {
    Eigen::VectorXd clipped = weights.unaryExpr([&](double w) {
        return clip(w, bounds.lower, bounds.upper);
    });

    bool degenerate = false;
    Eigen::VectorXd out = normalize(clipped, degenerate);
    if (degenerate) {
        logger()->warn("optimizer: clipped weights sum to ~0 within [{}, {}], using equal weights",
                       bounds.lower, bounds.upper);
    }
    if (fell_back != nullptr) {
        *fell_back = degenerate;
    }
    return out;
}

} // namespace factorlab
