#pragma once

#include <map>
#include <string>

namespace codebox::utils {

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

// Accepts "debug", "info", "warn"/"warning", "error" in any case.
bool ParseLogLevel(const std::string& text, LogLevel& level);

struct LogMessage {
    LogLevel level = LogLevel::kInfo;
    std::string tag;
    std::string message;
    std::map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void ConfigureLogging(const LogConfig& config);
LogLevel MinLogLevel();

std::string FormatLogLine(const LogMessage& message);
void Log(const LogMessage& message);
void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         std::map<std::string, std::string> fields = {});

}  // namespace codebox::utils
