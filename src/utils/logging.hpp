#pragma once

#include <string>
#include <unordered_map>

namespace gamesmith::utils {

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

// Accepts debug|info|warn|warning|error in any case; unknown names yield fallback.
LogLevel ParseLogLevel(const std::string& name, LogLevel fallback = LogLevel::kInfo);

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void ConfigureLogging(const LogConfig& config);
LogConfig CurrentLogConfig();

void Log(const LogMessage& entry);
void Log(LogLevel level, const std::string& tag, const std::string& message);

}  // namespace gamesmith::utils
