#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace utils {

inline std::string formatTime(std::time_t time, const char* format = "%Y-%m-%d %H:%M:%S") {
    std::tm tm{};
    localtime_r(&time, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, format);
    return ss.str();
}

inline std::string formatTime(std::chrono::system_clock::time_point timePoint,
                              const char* format = "%Y-%m-%d %H:%M:%S") {
    return formatTime(std::chrono::system_clock::to_time_t(timePoint), format);
}

// "backup_YYYYMMDD_HHMMSS"
inline std::string makeJobName(std::chrono::system_clock::time_point timePoint) {
    return "backup_" + formatTime(timePoint, "%Y%m%d_%H%M%S");
}

inline bool startsWith(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

inline std::string trim(const std::string& value) {
    const char* whitespace = " \t\r\n";
    auto begin = value.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(whitespace);
    return value.substr(begin, end - begin + 1);
}

} // namespace utils
