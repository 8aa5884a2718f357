#pragma once

#include <string>
#include <spdlog/spdlog.h>

namespace broker_messaging {

/**
 * @brief Install the process-wide default logger.
 *
 * Colour output to stdout, with the service name in every line. Calling it
 * again replaces the previous logger.
 *
 * @throws ConfigException for an unknown level name
 */
void configureLogging(const std::string& serviceName, const std::string& level = "info");

// Accepts trace, debug, info, warn/warning, error, critical and off
spdlog::level::level_enum parseLogLevel(const std::string& level);

} // namespace broker_messaging
