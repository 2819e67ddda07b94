/**
 * @file Panel.cpp
 * @brief Observation panel construction and schema validation
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#include "factorlab/Panel.hpp"
#include "factorlab/Errors.hpp"
#include <cmath>
#include <limits>
#include <set>

namespace factorlab {

namespace {
constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();
}

// =============================================================================
// CONSTRUCTION
// =============================================================================

ObservationPanel::ObservationPanel(const std::vector<Observation>& rows,
                                   const std::string& factor_name) {
    dates_.reserve(rows.size());
    entity_ids_.reserve(rows.size());
    realized_returns_.reserve(rows.size());

    std::vector<double> factor_values;
    factor_values.reserve(rows.size());

    for (const auto& row : rows) {
        dates_.push_back(row.date);
        entity_ids_.push_back(row.entity_id);
        realized_returns_.push_back(row.realized_return);
        factor_values.push_back(row.factor_value);
    }
    factors_[factor_name] = std::move(factor_values);
}

void ObservationPanel::add_row(Date date, const std::string& entity_id, double realized_return,
                               const std::map<std::string, double>& factors) {
    const size_t previous_rows = dates_.size();

    dates_.push_back(date);
    entity_ids_.push_back(entity_id);
    realized_returns_.push_back(realized_return);

    // New columns are back-filled as missing for earlier rows
    for (const auto& [name, value] : factors) {
        if (factors_.find(name) == factors_.end()) {
            factors_[name] = std::vector<double>(previous_rows, kMissing);
        }
    }
    for (auto& [name, column] : factors_) {
        const auto it = factors.find(name);
        column.push_back(it != factors.end() ? it->second : kMissing);
    }
}

void ObservationPanel::set_factor(const std::string& name, std::vector<double> values) {
    if (values.size() != dates_.size()) {
        throw SchemaError("factor column '" + name + "' has " + std::to_string(values.size()) +
                          " values for " + std::to_string(dates_.size()) + " rows");
    }
    factors_[name] = std::move(values);
}

void ObservationPanel::set_columns(std::vector<Date> dates,
                                   std::vector<std::string> entity_ids,
                                   std::vector<double> realized_returns) {
    dates_ = std::move(dates);
    entity_ids_ = std::move(entity_ids);
    realized_returns_ = std::move(realized_returns);
}

// =============================================================================
// ACCESS
// =============================================================================

bool ObservationPanel::has_factor(const std::string& name) const noexcept {
    return factors_.find(name) != factors_.end();
}

const std::vector<double>& ObservationPanel::factor(const std::string& name) const {
    const auto it = factors_.find(name);
    if (it == factors_.end()) {
        throw SchemaError("panel is missing required factor column '" + name + "'");
    }
    return it->second;
}

// =============================================================================
// SCHEMA VALIDATION
// =============================================================================

void ObservationPanel::validate(const std::string& factor_name) const {
    const std::vector<double>& factor_values = factor(factor_name);

    const size_t n = dates_.size();
    if (entity_ids_.size() != n || realized_returns_.size() != n || factor_values.size() != n) {
        throw SchemaError("panel columns have mismatched lengths: date=" + std::to_string(n) +
                          " entity_id=" + std::to_string(entity_ids_.size()) +
                          " realized_return=" + std::to_string(realized_returns_.size()) +
                          " " + factor_name + "=" + std::to_string(factor_values.size()));
    }

    for (size_t i = 0; i < n; ++i) {
        if (!std::isfinite(realized_returns_[i])) {
            throw SchemaError("realized_return is not finite at row " + std::to_string(i));
        }
    }

    std::set<std::pair<Date, std::string>> seen;
    for (size_t i = 0; i < n; ++i) {
        if (!seen.emplace(dates_[i], entity_ids_[i]).second) {
            throw ValidationError("duplicate entity '" + entity_ids_[i] + "' on date " +
                                  std::to_string(dates_[i]));
        }
    }
}

} // namespace factorlab
