#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace gamesmith::utils {

inline bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

inline std::string Trim(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && IsSpace(value[begin])) {
        ++begin;
    }
    while (end > begin && IsSpace(value[end - 1])) {
        --end;
    }
    return value.substr(begin, end - begin);
}

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

// Local-time strftime rendering of a wall-clock instant.
inline std::string FormatLocalTime(std::chrono::system_clock::time_point when, const char* format) {
    const auto time = std::chrono::system_clock::to_time_t(when);
    std::tm local_time{};
#if defined(_WIN32)
    localtime_s(&local_time, &time);
#else
    localtime_r(&time, &local_time);
#endif
    char buffer[64];
    const auto written = std::strftime(buffer, sizeof(buffer), format, &local_time);
    return std::string(buffer, written);
}

}  // namespace gamesmith::utils
