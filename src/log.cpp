#include "toolbridge/log.hpp"

#include <filesystem>

#include <log4cplus/configurator.h>
#include <log4cplus/helpers/loglog.h>
#include <log4cplus/loglevel.h>

namespace toolbridge::logging {

log4cplus::Logger& core() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("toolbridge"));
    return logger;
}

log4cplus::Logger& server() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("toolbridge.server"));
    return logger;
}

log4cplus::Logger& worker() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("toolbridge.worker"));
    return logger;
}

log4cplus::Logger& codec() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("toolbridge.codec"));
    return logger;
}

log4cplus::LogLevel parse_level(const std::string& level) {
    log4cplus::LogLevel ll = log4cplus::getLogLevelManager().fromString(
        LOG4CPLUS_STRING_TO_TSTRING(level));
    if (ll == log4cplus::NOT_SET_LOG_LEVEL) return log4cplus::INFO_LOG_LEVEL;
    return ll;
}

void init(const std::string& properties_path, const std::string& level) {
    if (!properties_path.empty()) {
        try {
            if (std::filesystem::exists(properties_path)) {
                log4cplus::PropertyConfigurator::doConfigure(
                    LOG4CPLUS_STRING_TO_TSTRING(properties_path));
                return;
            }
        } catch (const std::exception&) {
            log4cplus::helpers::LogLog::getLogLog()->error(
                LOG4CPLUS_TEXT("Failed to load logging config, using stderr defaults"));
        }
    }

    log4cplus::BasicConfigurator fallback(log4cplus::Logger::getDefaultHierarchy(), true);
    fallback.configure();
    log4cplus::Logger::getRoot().setLogLevel(parse_level(level));
}

} // namespace toolbridge::logging
