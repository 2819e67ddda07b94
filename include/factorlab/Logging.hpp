/**
 * @file Logging.hpp
 * @brief Library logger (spdlog)
 *
 * All FactorLab components log through one named logger, "factorlab".
 * Host applications may register their own logger under that name before
 * the first call to pick up their sinks and format.
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace factorlab {

inline constexpr const char* kLoggerName = "factorlab";

/**
 * @brief Get the library logger, creating a colored stderr logger on first use
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the level of the library logger
 */
void set_log_level(spdlog::level::level_enum level);

} // namespace factorlab
