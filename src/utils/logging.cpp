#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>

namespace codebox::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_write_mutex;

bool NeedsQuoting(const std::string& value) {
    if (value.empty()) {
        return true;
    }
    return std::any_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) || c == '"' || c == '=';
    });
}

}  // namespace

bool ParseLogLevel(const std::string& text, LogLevel& level) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        level = LogLevel::kDebug;
    } else if (lowered == "info") {
        level = LogLevel::kInfo;
    } else if (lowered == "warn" || lowered == "warning") {
        level = LogLevel::kWarn;
    } else if (lowered == "error") {
        level = LogLevel::kError;
    } else {
        return false;
    }
    return true;
}

void ConfigureLogging(const LogConfig& config) {
    g_min_level.store(static_cast<int>(config.min_level));
}

LogLevel MinLogLevel() {
    return static_cast<LogLevel>(g_min_level.load());
}

std::string FormatLogLine(const LogMessage& message) {
    std::ostringstream line;
    line << "[" << message.tag << "] " << message.message;
    for (const auto& [key, value] : message.fields) {
        line << " " << key << "=";
        if (NeedsQuoting(value)) {
            line << '"' << value << '"';
        } else {
            line << value;
        }
    }
    if (message.level == LogLevel::kWarn || message.level == LogLevel::kError) {
        line << " level=" << ToString(message.level);
    }
    return line.str();
}

void Log(const LogMessage& message) {
    if (static_cast<int>(message.level) < g_min_level.load()) {
        return;
    }
    const auto line = FormatLogLine(message);
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << line << std::endl;
}

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         std::map<std::string, std::string> fields) {
    Log(LogMessage{level, tag, message, std::move(fields)});
}

}  // namespace codebox::utils
