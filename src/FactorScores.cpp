/**
 * @file FactorScores.cpp
 * @brief Value / quality composite factor scores
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#include "factorlab/FactorScores.hpp"
#include "factorlab/Errors.hpp"
#include "factorlab/NumericUtils.hpp"
#include <cmath>
#include <limits>
#include <string>

namespace factorlab {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

inline double inverse_or_nan(double ratio) noexcept {
    return ratio == 0.0 ? kNaN : 1.0 / ratio;
}

void require_field(double value, const char* name) {
    if (!std::isfinite(value)) {
        throw ValidationError(std::string("fundamentals field '") + name + "' is not finite");
    }
}

} // namespace

void Fundamentals::validate() const {
    require_field(pe_ratio, "pe_ratio");
    require_field(pb_ratio, "pb_ratio");
    require_field(ev_ebitda, "ev_ebitda");
    require_field(roe, "roe");
    require_field(de_ratio, "de_ratio");
}

// =============================================================================
// Z-SCORES
// =============================================================================

Eigen::VectorXd z_scores(const Eigen::Ref<const Eigen::VectorXd>& values) {
    std::vector<double> finite;
    finite.reserve(static_cast<size_t>(values.size()));
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        if (!std::isnan(values(i))) {
            finite.push_back(values(i));
        }
    }

    Eigen::VectorXd z = Eigen::VectorXd::Constant(values.size(), kNaN);
    if (finite.empty()) {
        return z;
    }

    Eigen::Map<const Eigen::VectorXd> observed(finite.data(), static_cast<Eigen::Index>(finite.size()));
    const double mean = observed.mean();
    const double sd = population_std(observed);
    if (sd == 0.0) {
        return z;
    }

    for (Eigen::Index i = 0; i < values.size(); ++i) {
        if (!std::isnan(values(i))) {
            z(i) = (values(i) - mean) / sd;
        }
    }
    return z;
}

// =============================================================================
// COMPOSITE SCORES
// =============================================================================

std::vector<FactorScores> compute_factor_scores(const std::vector<Fundamentals>& universe) {
    if (universe.empty()) {
        throw ValidationError("compute_factor_scores: universe is empty");
    }
    for (const auto& record : universe) {
        record.validate();
    }

    const auto n = static_cast<Eigen::Index>(universe.size());

    // Column layout: earnings_yield, book_to_market, ev_ebitda_inverse, roe, de_ratio
    Eigen::MatrixXd raw(n, 5);
    for (Eigen::Index i = 0; i < n; ++i) {
        const Fundamentals& f = universe[static_cast<size_t>(i)];
        raw(i, 0) = inverse_or_nan(f.pe_ratio);
        raw(i, 1) = inverse_or_nan(f.pb_ratio);
        raw(i, 2) = inverse_or_nan(f.ev_ebitda);
        raw(i, 3) = f.roe;
        raw(i, 4) = f.de_ratio;
    }

    Eigen::MatrixXd z(n, 5);
    for (Eigen::Index c = 0; c < 5; ++c) {
        z.col(c) = z_scores(raw.col(c));
    }
    // Lower leverage is better
    z.col(4) = -z.col(4);

    std::vector<FactorScores> scores(universe.size());
    for (Eigen::Index i = 0; i < n; ++i) {
        FactorScores& s = scores[static_cast<size_t>(i)];
        s.earnings_yield = raw(i, 0);
        s.book_to_market = raw(i, 1);
        s.ev_ebitda_inverse = raw(i, 2);

        const Eigen::VectorXd value_z = z.row(i).head(3).transpose();
        const Eigen::VectorXd quality_z = z.row(i).tail(2).transpose();
        s.value_score = nan_mean(value_z);
        s.quality_score = nan_mean(quality_z);
        s.vq_score = (s.value_score + s.quality_score) / 2.0;
    }
    return scores;
}

} // namespace factorlab
