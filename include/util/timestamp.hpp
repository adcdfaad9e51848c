#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace cw::util {

// "2024-05-01T13:45:10" in local time
inline std::string localIsoTimestamp(const std::chrono::system_clock::time_point tp = std::chrono::system_clock::now()) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buffer[20];
    strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);
    return {buffer};
}

inline std::string utcIsoTimestamp(const std::chrono::system_clock::time_point tp = std::chrono::system_clock::now()) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buffer[21];
    strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return {buffer};
}

}
