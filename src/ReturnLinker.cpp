/**
 * @file ReturnLinker.cpp
 * @brief Geometric linking of period returns
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#include "factorlab/ReturnLinker.hpp"

namespace factorlab {

Eigen::VectorXd chain_cumulative(double base_cumulative,
                                 const Eigen::Ref<const Eigen::VectorXd>& period_returns) {
    Eigen::VectorXd cumulative(period_returns.size());

    double growth = 1.0 + base_cumulative;
    for (Eigen::Index t = 0; t < period_returns.size(); ++t) {
        growth *= 1.0 + period_returns(t);
        cumulative(t) = growth - 1.0;
    }
    return cumulative;
}

Eigen::VectorXd link_returns(const Eigen::Ref<const Eigen::VectorXd>& period_returns) {
    return chain_cumulative(0.0, period_returns);
}

std::vector<double> link_returns(const std::vector<double>& period_returns) {
    Eigen::Map<const Eigen::VectorXd> mapped(period_returns.data(),
                                             static_cast<Eigen::Index>(period_returns.size()));
    const Eigen::VectorXd cumulative = link_returns(mapped);
    return std::vector<double>(cumulative.data(), cumulative.data() + cumulative.size());
}

Eigen::MatrixXd link_returns_columnwise(const Eigen::MatrixXd& period_returns) {
    Eigen::MatrixXd cumulative(period_returns.rows(), period_returns.cols());
    for (Eigen::Index c = 0; c < period_returns.cols(); ++c) {
        cumulative.col(c) = link_returns(period_returns.col(c));
    }
    return cumulative;
}

} // namespace factorlab
