#pragma once
#include <string>
#include <log4cplus/logger.h>
#include <log4cplus/loggingmacros.h>

namespace toolbridge::logging {

log4cplus::Logger& core();
log4cplus::Logger& server();
log4cplus::Logger& worker();
log4cplus::Logger& codec();

/// Load a log4cplus properties file if it exists; otherwise log to stderr at
/// `level`. stdout is never used: it carries protocol traffic.
void init(const std::string& properties_path, const std::string& level = "INFO");

/// Unknown names map to INFO.
log4cplus::LogLevel parse_level(const std::string& level);

} // namespace toolbridge::logging
