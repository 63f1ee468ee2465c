#ifndef AGENTKERNEL_COMMON_LOGGING_LOGGER_H
#define AGENTKERNEL_COMMON_LOGGING_LOGGER_H

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace agentkernel {

// Shared "agentkernel" logger (stderr, colored). Created on first use.
std::shared_ptr<spdlog::logger> logger();

// level: trace|debug|info|warn|error|critical|off. Throws ConfigError on an unknown level.
void init_logging(const std::string& level, const std::string& pattern = "");

} // namespace agentkernel

#endif // AGENTKERNEL_COMMON_LOGGING_LOGGER_H
