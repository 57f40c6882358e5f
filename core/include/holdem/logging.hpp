#pragma once

#include <chrono>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <string>

namespace holdem {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
    Off
};

inline LogLevel& min_log_level() {
    static LogLevel level = LogLevel::Info;
    return level;
}

inline void set_log_level(LogLevel level) {
    min_log_level() = level;
}

inline const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

inline LogLevel parse_log_level(const std::string& text) {
    if (text == "debug") return LogLevel::Debug;
    if (text == "info") return LogLevel::Info;
    if (text == "warn") return LogLevel::Warn;
    if (text == "error") return LogLevel::Error;
    if (text == "off") return LogLevel::Off;
    throw std::invalid_argument("Unknown log level: " + text);
}

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%FT%TZ");
    return ss.str();
}

/// Writes one JSON line to stderr; stdout belongs to the console front-end.
inline void log(LogLevel level, const std::string& domain, const std::string& message,
                const nlohmann::json& fields = {}) {
    if (level == LogLevel::Off || level < min_log_level()) {
        return;
    }
    nlohmann::json log_entry = {
        {"level", to_string(level)},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        log_entry[key] = value;
    }
    std::clog << log_entry.dump() << std::endl;
}

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

}  // namespace holdem
