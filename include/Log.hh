// Log.hh
#ifndef LOG_H
#define LOG_H
#pragma once
#include <string>

enum class LogLevel {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

// Process wide verbosity. Lines are written with std::cout / std::cerr and a
// bracketed component tag, callers check log_enabled() before building them.
inline LogLevel& log_level() {
    static LogLevel level = LogLevel::Info;
    return level;
}

inline void set_log_level(LogLevel level) { log_level() = level; }

inline bool log_enabled(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(log_level());
}

// Accepts error, warn, info, debug. Returns false for anything else.
inline bool parse_log_level(const std::string& text, LogLevel& level) {
    if (text == "error") { level = LogLevel::Error; return true; }
    if (text == "warn" || text == "warning") { level = LogLevel::Warn; return true; }
    if (text == "info") { level = LogLevel::Info; return true; }
    if (text == "debug" || text == "trace") { level = LogLevel::Debug; return true; }
    return false;
}

inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn: return "warn";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
        default: return "unknown";
    }
}

#endif
