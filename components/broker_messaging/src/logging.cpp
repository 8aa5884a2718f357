// src/logging.cpp
#include "broker_messaging/logging.hpp"
#include "broker_messaging/types.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace broker_messaging {

spdlog::level::level_enum parseLogLevel(const std::string& level) {
    std::string name = level;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;

    throw ConfigException("Unknown log level '" + level + "'");
}

void configureLogging(const std::string& serviceName, const std::string& level) {
    auto parsed = parseLogLevel(level);

    const std::string loggerName = serviceName.empty() ? "broker_messaging" : serviceName;
    spdlog::drop(loggerName);

    auto logger = spdlog::stdout_color_mt(loggerName);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v");
    logger->set_level(parsed);
    // Warnings and above reach the sink right away
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
}

} // namespace broker_messaging
