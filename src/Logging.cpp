/**
 * @file Logging.cpp
 * @brief Library logger setup
 *
 * @author FactorLab Development Team
 * @date October 2026
 */

#include "factorlab/Logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace factorlab {

std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(kLoggerName);
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace factorlab
