#pragma once

#include <atomic>
#include <iostream>
#include <map>
#include <string>

namespace codecred::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

inline LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    if (value == "debug" || value == "DEBUG") {
        return LogLevel::kDebug;
    }
    if (value == "info" || value == "INFO") {
        return LogLevel::kInfo;
    }
    if (value == "warn" || value == "WARN" || value == "warning") {
        return LogLevel::kWarn;
    }
    if (value == "error" || value == "ERROR") {
        return LogLevel::kError;
    }
    return fallback;
}

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

inline std::atomic<LogLevel>& MinLogLevel() {
    static std::atomic<LogLevel> level{LogLevel::kInfo};
    return level;
}

inline void ApplyLogConfig(const LogConfig& config) {
    MinLogLevel().store(config.min_level);
}

inline bool ShouldLog(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(MinLogLevel().load());
}

// Writes "[tag] message key=value ..." to stderr.
inline void Log(const LogMessage& entry) {
    if (!ShouldLog(entry.level)) {
        return;
    }
    std::cerr << "[" << entry.tag << "] ";
    if (entry.level == LogLevel::kWarn || entry.level == LogLevel::kError) {
        std::cerr << ToString(entry.level) << " ";
    }
    std::cerr << entry.message;
    for (const auto& [key, value] : entry.fields) {
        std::cerr << " " << key << "=" << value;
    }
    std::cerr << std::endl;
}

inline void Log(LogLevel level,
                const std::string& tag,
                const std::string& message,
                std::map<std::string, std::string> fields = {}) {
    Log(LogMessage{level, tag, message, std::move(fields)});
}

}  // namespace codecred::utils
