#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

namespace gamesmith::utils {
namespace {

std::atomic<LogLevel> g_min_level{LogLevel::kInfo};
std::mutex g_sink_mutex;

}  // namespace

LogLevel ParseLogLevel(const std::string& name, LogLevel fallback) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void ConfigureLogging(const LogConfig& config) {
    g_min_level.store(config.min_level);
}

LogConfig CurrentLogConfig() {
    LogConfig config{};
    config.min_level = g_min_level.load();
    return config;
}

void Log(const LogMessage& entry) {
    if (static_cast<int>(entry.level) < static_cast<int>(g_min_level.load())) {
        return;
    }
    std::ostringstream line;
    line << "[" << ToString(entry.level) << "] [" << entry.tag << "] " << entry.message;
    // Sorted so repeated runs produce comparable lines.
    const std::map<std::string, std::string> ordered(entry.fields.begin(), entry.fields.end());
    for (const auto& [key, value] : ordered) {
        line << " " << key << "=" << value;
    }
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    std::cerr << line.str() << std::endl;
}

void Log(LogLevel level, const std::string& tag, const std::string& message) {
    Log(LogMessage{level, tag, message, {}});
}

}  // namespace gamesmith::utils
