#pragma once

#include <cstdio>
#include <cstdarg>

namespace tagsense {

// Log levels
enum class LogLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG = 4,
    TRACE = 5
};

// Global log level - can be changed at runtime
// Default to INFO for release, DEBUG for debug builds
#ifdef NDEBUG
inline LogLevel g_log_level = LogLevel::INFO;
#else
inline LogLevel g_log_level = LogLevel::DEBUG;
#endif

// Log category enable flags
struct LogCategories {
    bool frontend = true;   // Slot averaging, normalization, channel build
    bool solver = true;     // Tikhonov solve and numeric recovery
    bool model = true;      // Networks and parameter snapshot
    bool io = true;         // Frame reader, packets, CLI
};

inline LogCategories g_log_categories;

inline void setLogLevel(LogLevel level) {
    g_log_level = level;
}

// Core logging function
inline void log(LogLevel level, const char* category, const char* format, ...) {
    if (level > g_log_level) return;

    const char* level_str = "";
    switch (level) {
        case LogLevel::ERROR: level_str = "ERROR"; break;
        case LogLevel::WARN:  level_str = "WARN "; break;
        case LogLevel::INFO:  level_str = "INFO "; break;
        case LogLevel::DEBUG: level_str = "DEBUG"; break;
        case LogLevel::TRACE: level_str = "TRACE"; break;
        default: break;
    }

    fprintf(stderr, "[%s][%s] ", level_str, category);

    va_list args;
    va_start(args, format);
    vfprintf(stderr, format, args);
    va_end(args);

    fprintf(stderr, "\n");
}

// Convenience macros - these compile to nothing when TAGSENSE_LOG_DISABLE is defined
#ifdef TAGSENSE_LOG_DISABLE

#define LOG_ERROR(cat, fmt, ...)
#define LOG_WARN(cat, fmt, ...)
#define LOG_INFO(cat, fmt, ...)
#define LOG_DEBUG(cat, fmt, ...)
#define LOG_TRACE(cat, fmt, ...)

#else

#define LOG_ERROR(cat, fmt, ...) \
    tagsense::log(tagsense::LogLevel::ERROR, cat, fmt, ##__VA_ARGS__)

#define LOG_WARN(cat, fmt, ...) \
    tagsense::log(tagsense::LogLevel::WARN, cat, fmt, ##__VA_ARGS__)

#define LOG_INFO(cat, fmt, ...) \
    tagsense::log(tagsense::LogLevel::INFO, cat, fmt, ##__VA_ARGS__)

#define LOG_DEBUG(cat, fmt, ...) \
    do { if (tagsense::g_log_level >= tagsense::LogLevel::DEBUG) \
        tagsense::log(tagsense::LogLevel::DEBUG, cat, fmt, ##__VA_ARGS__); } while(0)

#define LOG_TRACE(cat, fmt, ...) \
    do { if (tagsense::g_log_level >= tagsense::LogLevel::TRACE) \
        tagsense::log(tagsense::LogLevel::TRACE, cat, fmt, ##__VA_ARGS__); } while(0)

#endif

// Category-specific logging macros
#define LOG_FRONT(level, fmt, ...) \
    do { if (tagsense::g_log_categories.frontend) LOG_##level("FRONT", fmt, ##__VA_ARGS__); } while(0)

#define LOG_SOLVE(level, fmt, ...) \
    do { if (tagsense::g_log_categories.solver) LOG_##level("SOLVE", fmt, ##__VA_ARGS__); } while(0)

#define LOG_MODEL(level, fmt, ...) \
    do { if (tagsense::g_log_categories.model) LOG_##level("MODEL", fmt, ##__VA_ARGS__); } while(0)

#define LOG_IO(level, fmt, ...) \
    do { if (tagsense::g_log_categories.io) LOG_##level("IO", fmt, ##__VA_ARGS__); } while(0)

} // namespace tagsense
