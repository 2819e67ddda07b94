/**
 * @file Errors.hpp
 * @brief Exception hierarchy for FactorLab input validation
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace factorlab {

/**
 * @brief Caller contract violation (bad parameter, empty series, ...)
 */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief Required column missing, ragged, or holding non-finite values
 *
 * Raised before any computation starts.
 */
class SchemaError : public ValidationError {
public:
    explicit SchemaError(const std::string& what)
        : ValidationError(what) {}
};

/**
 * @brief Not enough rankable rows on a date to fill every bucket
 */
class CardinalityError : public ValidationError {
public:
    CardinalityError(const std::string& what, std::int64_t date)
        : ValidationError(what)
        , date_(date) {}

    [[nodiscard]] std::int64_t date() const noexcept { return date_; }

private:
    std::int64_t date_;
};

} // namespace factorlab
