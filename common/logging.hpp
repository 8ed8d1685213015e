#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <string>

namespace diffgrowth {
namespace logging {

constexpr const char* kLoggerName = "diffgrowth";
constexpr const char* kLevelEnvVar = "DIFFGROWTH_LOG_LEVEL";

// Accepts spdlog's level names (trace, debug, info, warning/warn, error/err,
// critical, off). Missing or unknown values give info.
inline spdlog::level::level_enum parse_log_level(const char* value) {
    if (value == nullptr || *value == '\0') {
        return spdlog::level::info;
    }
    std::string name(value);
    spdlog::level::level_enum level = spdlog::level::from_str(name);
    // from_str maps anything it does not recognize to off
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::get(kLoggerName);
        if (!log) {
            log = spdlog::stderr_color_mt(kLoggerName);
        }
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        log->set_level(parse_log_level(std::getenv(kLevelEnvVar)));
        return log;
    }();
    return logger;
}

}  // namespace logging
}  // namespace diffgrowth
