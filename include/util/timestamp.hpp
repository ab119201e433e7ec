#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ih::util {

inline std::time_t parsePostgresTimestamp(const std::string& timestampStr) {
    std::tm tm = {};
    std::istringstream ss(timestampStr.substr(0, 19)); // truncate to "YYYY-MM-DD HH:MM:SS"
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + timestampStr);
    return timegm(&tm);
}

inline std::string timestampToString(const std::time_t ts) {
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&ts), "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

// x-amz-date format
inline std::string getCurrentTimestamp() {
    const std::time_t now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    const std::tm tm = *gmtime(&now_c);
    char buffer[17];
    strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &tm);
    return {buffer};
}

inline std::string getDate() {
    const std::time_t now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    const std::tm tm = *gmtime(&now_c);
    char buffer[9];
    strftime(buffer, sizeof(buffer), "%Y%m%d", &tm);
    return {buffer};
}

// "YYYY-MM" in local time
inline std::string yearMonth(const std::time_t ts) {
    std::tm tm{};
    localtime_r(&ts, &tm);
    char buffer[8];
    strftime(buffer, sizeof(buffer), "%Y-%m", &tm);
    return {buffer};
}

}
