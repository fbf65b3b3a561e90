#pragma once

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace zktable {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

inline const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

/**
 * Map a ZKTABLE_LOG_LEVEL value to a level; unset or unknown values mean "info".
 */
inline LogLevel parse_log_level(const char* value) {
    std::string name = value ? value : "";
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

/**
 * Threshold read once from ZKTABLE_LOG_LEVEL.
 */
inline LogLevel log_threshold() {
    static const LogLevel threshold = parse_log_level(std::getenv("ZKTABLE_LOG_LEVEL"));
    return threshold;
}

inline void log(LogLevel level, const std::string& component, const std::string& message,
                const nlohmann::json& fields = {}) {
    if (level < log_threshold()) {
        return;
    }
    nlohmann::json log_entry = {
        {"level", level_name(level)},
        {"message", message},
        {"component", component},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        log_entry[key] = value;
    }
    std::clog << log_entry.dump() << std::endl;
}

inline void log_debug(const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Debug, component, message, fields);
}

inline void log_warn(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Warn, component, message, fields);
}

}  // namespace zktable
