/**
 * @file MeanVarianceOptimizer.hpp
 * @brief Closed-form mean-variance portfolio weights
 *
 * FactorLab - Portfolio Construction
 *
 * Mathematical Framework:
 * 1. mu    = sample mean of each asset's returns
 * 2. Sigma = sample covariance (ddof = 1)
 * 3. raw   = pinv(Sigma) * mu / lambda
 * 4. w     = raw / sum(raw)
 * 5. Optional: w = clip(w, lower, upper); w = w / sum(w)
 *
 * lambda only rescales raw and cancels in step 4, so the weights do not
 * depend on risk aversion. Step 5 is a clip-and-renormalize approximation,
 * not a constrained solve: after renormalization a weight may land outside
 * [lower, upper] again.
 *
 * The pseudo-inverse makes singular covariance (collinear assets, fewer
 * observations than assets) a non-event.
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace factorlab {

/**
 * @brief Per-asset weight bounds applied by clip-and-renormalize
 */
struct WeightBounds {
    double lower = 0.0;
    double upper = 1.0;

    WeightBounds() = default;
    WeightBounds(double lo, double hi) : lower(lo), upper(hi) {}
};

/**
 * @brief Optimizer parameters
 */
struct OptimizerParams {
    double risk_aversion = 1.0;                 // lambda, must be > 0
    std::optional<WeightBounds> weight_bounds;  // No clipping when empty
    double pinv_rcond = 1e-15;                  // Relative singular value cutoff

    /**
     * @throws ValidationError on lambda <= 0 or lower > upper
     */
    void validate() const;
};

/**
 * @brief Result of one optimization
 */
struct OptimizationResult {
    Eigen::VectorXd weights;             // Sums to 1
    Eigen::VectorXd expected_returns;    // mu
    Eigen::MatrixXd covariance;          // Sigma
    bool clipped;                        // Bounds were applied
    bool equal_weight_fallback;          // Degenerate normalizer, equal weights used
    int64_t latency_ns;                  // Calculation time

    OptimizationResult() : clipped(false), equal_weight_fallback(false), latency_ns(0) {}
};

/**
 * @brief Unconstrained (optionally clipped) mean-variance optimizer
 */
class MeanVarianceOptimizer {
public:
    /**
     * @brief Construct with default parameters (lambda = 1, no bounds)
     */
    MeanVarianceOptimizer();

    /**
     * @brief Construct with custom parameters
     * @throws ValidationError if params are invalid
     */
    explicit MeanVarianceOptimizer(const OptimizerParams& params);

    /**
     * @brief Compute weights from a return matrix
     *
     * @param returns Matrix of shape (T x N):
     *                T = number of time periods (rows), T >= 2
     *                N = number of assets (columns), N >= 1
     *                All entries must be finite
     * @throws ValidationError on bad shape or non-finite input
     */
    [[nodiscard]] OptimizationResult optimize(const Eigen::MatrixXd& returns);

    /**
     * @brief Compute weights keyed by symbol (zero-copy from NumPy)
     *
     * @param returns Matrix of shape (T x N) in Row-Major storage
     * @param symbols Vector of N symbol names
     * @throws ValidationError if symbols.size() != N
     */
    using RowMajorMatrixXd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

    [[nodiscard]] std::unordered_map<std::string, double> optimize_map(
        const Eigen::Ref<const RowMajorMatrixXd>& returns,
        const std::vector<std::string>& symbols
    );

    /**
     * @brief Compute weights keyed by symbol (column-major overload)
     */
    [[nodiscard]] std::unordered_map<std::string, double> optimize_map(
        const Eigen::MatrixXd& returns,
        const std::vector<std::string>& symbols
    );

    /**
     * @brief Clip weights into bounds and re-normalize to sum to 1
     *
     * @param fell_back Set when the clipped sum was degenerate and equal
     *                  weights were returned instead
     */
    [[nodiscard]] static Eigen::VectorXd clip_and_normalize(const Eigen::VectorXd& weights,
                                                            const WeightBounds& bounds,
                                                            bool* fell_back = nullptr);

    [[nodiscard]] int64_t last_latency_ns() const noexcept { return last_latency_ns_; }

    [[nodiscard]] const OptimizerParams& params() const noexcept { return params_; }

    /**
     * @brief Update parameters
     * @throws ValidationError if params are invalid
     */
    void set_params(const OptimizerParams& params);

private:
    OptimizerParams params_;
    int64_t last_latency_ns_;

    /**
     * @brief Divide by the sum, or fall back to 1/N when the sum is ~0
     */
    [[nodiscard]] static Eigen::VectorXd normalize(const Eigen::VectorXd& raw, bool& fell_back);
};

} // namespace factorlab
