/**
 * @file Panel.hpp
 * @brief Cross-sectional observation panel
 *
 * Column-oriented table of (date, entity, realized return) rows carrying one
 * or more named factor columns. A factor value of NaN marks a missing
 * observation. Rows need not be sorted.
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace factorlab {

/// Ordinal date key (e.g. 20240131); only its ordering is used
using Date = std::int64_t;

/**
 * @brief Single observation row, used for row-wise panel construction
 */
struct Observation {
    Date date;
    std::string entity_id;
    double factor_value;        // NaN if missing
    double realized_return;     // Return over the holding period following date

    Observation() : date(0), factor_value(0.0), realized_return(0.0) {}

    Observation(Date d, std::string id, double factor, double ret)
        : date(d), entity_id(std::move(id)), factor_value(factor), realized_return(ret) {}
};

/**
 * @brief Observation panel with named factor columns
 */
class ObservationPanel {
public:
    ObservationPanel() = default;

    /**
     * @brief Build a panel from rows, storing their factor under factor_name
     */
    ObservationPanel(const std::vector<Observation>& rows, const std::string& factor_name);

    /**
     * @brief Append a row; every existing factor column receives the value in
     *        factors, or NaN when absent from the map
     */
    void add_row(Date date, const std::string& entity_id, double realized_return,
                 const std::map<std::string, double>& factors = {});

    /**
     * @brief Attach (or replace) a named factor column
     * @throws SchemaError if the column length differs from the row count
     */
    void set_factor(const std::string& name, std::vector<double> values);

    [[nodiscard]] bool has_factor(const std::string& name) const noexcept;

    /**
     * @brief Access a named factor column
     * @throws SchemaError if the column does not exist
     */
    [[nodiscard]] const std::vector<double>& factor(const std::string& name) const;

    /**
     * @brief Check column lengths, finite returns and (date, entity) uniqueness
     *
     * @param factor_name Factor column the caller is about to use
     * @throws SchemaError on a missing or ragged column or a non-finite return
     * @throws ValidationError on a duplicated (date, entity_id) pair
     */
    void validate(const std::string& factor_name) const;

    [[nodiscard]] size_t size() const noexcept { return dates_.size(); }
    [[nodiscard]] bool empty() const noexcept { return dates_.empty(); }

    [[nodiscard]] const std::vector<Date>& dates() const noexcept { return dates_; }
    [[nodiscard]] const std::vector<std::string>& entity_ids() const noexcept { return entity_ids_; }
    [[nodiscard]] const std::vector<double>& realized_returns() const noexcept { return realized_returns_; }
    [[nodiscard]] const std::map<std::string, std::vector<double>>& factors() const noexcept { return factors_; }

    /**
     * @brief Direct column setters for bulk loading from a columnar source
     *
     * Lengths are checked by validate(), not here.
     */
    void set_columns(std::vector<Date> dates,
                     std::vector<std::string> entity_ids,
                     std::vector<double> realized_returns);

private:
    std::vector<Date> dates_;
    std::vector<std::string> entity_ids_;
    std::vector<double> realized_returns_;
    std::map<std::string, std::vector<double>> factors_;
};

} // namespace factorlab
