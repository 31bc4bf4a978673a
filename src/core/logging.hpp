// File: src/core/logging.hpp
#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace careledger {

/// Name of the shared logger every component writes to
inline constexpr const char* kLoggerName = "careledger";

/// Get the process-wide "careledger" logger, creating a colored stderr
/// logger on first use.
std::shared_ptr<spdlog::logger> GetLogger();

/// Apply level ("trace", "debug", "info", "warn", "error", "critical", "off")
/// and output pattern to the careledger logger.
/// @return false if the level name is not recognized (level left unchanged)
bool ConfigureLogging(const std::string& level, const std::string& pattern = "");

} // namespace careledger
