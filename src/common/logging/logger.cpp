// common/logging/logger.cpp
#include "common/logging/logger.h"
#include "core/types/errors.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace agentkernel {

namespace {

constexpr const char* kLoggerName = "agentkernel";
constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v";

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (!spdlog::get(kLoggerName)) {
            auto created = spdlog::stderr_color_mt(kLoggerName);
            created->set_pattern(kDefaultPattern);
            created->set_level(spdlog::level::info);
        }
    });
    return spdlog::get(kLoggerName);
}

void init_logging(const std::string& level, const std::string& pattern) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        throw ConfigError("Unknown log level '" + level + "'");
    }
    auto log = logger();
    log->set_level(parsed);
    log->set_pattern(pattern.empty() ? kDefaultPattern : pattern);
}

} // namespace agentkernel
