// File: src/core/logging.cpp
#include "core/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace careledger {

std::shared_ptr<spdlog::logger> GetLogger() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (!spdlog::get(kLoggerName)) {
            auto logger = spdlog::stderr_color_mt(kLoggerName);
            logger->set_level(spdlog::level::info);
        }
    });
    return spdlog::get(kLoggerName);
}

bool ConfigureLogging(const std::string& level, const std::string& pattern) {
    auto logger = GetLogger();

    if (!pattern.empty()) {
        logger->set_pattern(pattern);
    }

    // from_str() maps unknown names to "off"; only accept real level names
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        logger->warn("Unknown log level '{}', keeping {}", level,
                     spdlog::level::to_string_view(logger->level()));
        return false;
    }

    logger->set_level(parsed);
    return true;
}

} // namespace careledger
