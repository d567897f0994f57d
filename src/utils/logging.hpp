#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <sstream>
#include <string>

namespace scriptbox::utils {

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

inline bool ParseLogLevel(const std::string& value, LogLevel* level) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        *level = LogLevel::kDebug;
    } else if (lowered == "info") {
        *level = LogLevel::kInfo;
    } else if (lowered == "warn" || lowered == "warning") {
        *level = LogLevel::kWarn;
    } else if (lowered == "error") {
        *level = LogLevel::kError;
    } else {
        return false;
    }
    return true;
}

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

namespace detail {

inline std::atomic<int>& MinLevel() {
    static std::atomic<int> level{static_cast<int>(LogConfig{}.min_level)};
    return level;
}

}  // namespace detail

// Set once at start-up, before the server threads exist.
inline void ConfigureLogging(const LogConfig& config) {
    detail::MinLevel().store(static_cast<int>(config.min_level));
}

inline bool ShouldLog(LogLevel level) {
    return static_cast<int>(level) >= detail::MinLevel().load();
}

// Writes "[tag] message" to stderr as a single write so lines from
// concurrent requests do not interleave.
inline void Log(LogLevel level, const std::string& tag, const std::string& message) {
    if (!ShouldLog(level)) {
        return;
    }
    std::ostringstream line;
    line << "[" << tag << "] ";
    if (level != LogLevel::kInfo) {
        line << ToString(level) << " ";
    }
    line << message << "\n";
    std::cerr << line.str() << std::flush;
}

}  // namespace scriptbox::utils
