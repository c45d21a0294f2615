#include "stockguard/logging.hpp"
#include "stockguard/errors.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace stockguard {

namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::Info)};
std::mutex g_write_mutex;

}  // namespace

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    throw InvalidArgumentError("Unknown log level: " + name);
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

void set_log_level(LogLevel level) {
    g_min_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_min_level.load(std::memory_order_relaxed));
}

std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

void log(LogLevel level, const std::string& domain, const std::string& message,
         const nlohmann::json& fields) {
    if (static_cast<int>(level) < g_min_level.load(std::memory_order_relaxed)) return;

    nlohmann::json log_entry = {
        {"level", log_level_name(level)},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    if (fields.is_object()) {
        for (auto& [key, value] : fields.items()) {
            log_entry[key] = value;
        }
    }

    const std::string line = log_entry.dump();
    std::lock_guard<std::mutex> lock(g_write_mutex);
    auto& out = level >= LogLevel::Warn ? std::cerr : std::cout;
    out << line << std::endl;
}

}  // namespace stockguard
