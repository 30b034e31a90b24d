#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>
#include <vector>

namespace codebox::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

inline std::string Trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n\f\v");
    return value.substr(start, end - start + 1);
}

// Local time as YYYY-MM-DDTHH:MM:SS.ffffff.
inline std::string FormatIsoTimestamp(std::chrono::system_clock::time_point point) {
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(point);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(point - seconds).count();
    const std::time_t raw = std::chrono::system_clock::to_time_t(seconds);
    std::tm local{};
    localtime_r(&raw, &local);
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &local);
    char fraction[16];
    std::snprintf(fraction, sizeof(fraction), ".%06lld", static_cast<long long>(micros));
    return std::string(date) + fraction;
}

}  // namespace codebox::utils
