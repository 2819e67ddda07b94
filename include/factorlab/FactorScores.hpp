/**
 * @file FactorScores.hpp
 * @brief Value / quality composite factor scores from fundamentals
 *
 * FactorLab - Factor Construction
 *
 * Per entity:
 *   earnings_yield    = 1 / pe_ratio
 *   book_to_market    = 1 / pb_ratio
 *   ev_ebitda_inverse = 1 / ev_ebitda       (NaN where the ratio is zero)
 *
 * Across the supplied cross-section (population z-scores, NaNs skipped):
 *   value_score   = mean(z(earnings_yield), z(book_to_market), z(ev_ebitda_inverse))
 *   quality_score = mean(z(roe), -z(de_ratio))
 *   vq_score      = (value_score + quality_score) / 2
 *
 * Higher is cheaper / higher quality. The bucketer puts LOW values in
 * bucket 1, so negate vq_score if bucket 1 should hold the best names.
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#pragma once

#include <Eigen/Dense>
#include <vector>

namespace factorlab {

/**
 * @brief Fundamental ratios for one entity; all fields required
 */
struct Fundamentals {
    double pe_ratio;
    double pb_ratio;
    double ev_ebitda;
    double roe;
    double de_ratio;

    Fundamentals() : pe_ratio(0), pb_ratio(0), ev_ebitda(0), roe(0), de_ratio(0) {}

    Fundamentals(double pe, double pb, double ev, double r, double de)
        : pe_ratio(pe), pb_ratio(pb), ev_ebitda(ev), roe(r), de_ratio(de) {}

    /**
     * @throws ValidationError naming the first non-finite field
     */
    void validate() const;
};

/**
 * @brief Derived factor values for one entity
 */
struct FactorScores {
    double earnings_yield;
    double book_to_market;
    double ev_ebitda_inverse;
    double value_score;
    double quality_score;
    double vq_score;

    FactorScores()
        : earnings_yield(0.0)
        , book_to_market(0.0)
        , ev_ebitda_inverse(0.0)
        , value_score(0.0)
        , quality_score(0.0)
        , vq_score(0.0) {}
};

/**
 * @brief Score a cross-section of entities
 *
 * @param universe One record per entity; z-scores are taken over this set
 * @return One FactorScores per input, same order
 * @throws ValidationError if universe is empty or a record is invalid
 */
[[nodiscard]] std::vector<FactorScores> compute_factor_scores(const std::vector<Fundamentals>& universe);

/**
 * @brief Population z-scores of a column, skipping NaNs
 *
 * Entries are NaN where the input is NaN or the column has zero dispersion.
 */
[[nodiscard]] Eigen::VectorXd z_scores(const Eigen::Ref<const Eigen::VectorXd>& values);

} // namespace factorlab
