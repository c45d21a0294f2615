#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace stockguard {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/**
 * Parse "debug", "info", "warn" or "error". Throws InvalidArgumentError otherwise.
 */
LogLevel parse_log_level(const std::string& name);

const char* log_level_name(LogLevel level);

/**
 * Records below this level are dropped. Defaults to Info.
 */
void set_log_level(LogLevel level);
LogLevel log_level();

std::string now_iso8601();

/**
 * Write one JSON line: level, message, domain, timestamp plus the given fields.
 * Warn and Error go to stderr, the rest to stdout.
 */
void log(LogLevel level, const std::string& domain, const std::string& message,
         const nlohmann::json& fields = {});

inline void log_debug(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Debug, domain, message, fields);
}

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Info, domain, message, fields);
}

inline void log_warn(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Warn, domain, message, fields);
}

inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Error, domain, message, fields);
}

}  // namespace stockguard
