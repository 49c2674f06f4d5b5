#pragma once

#include <cstdio>
#include <cstdarg>

namespace stegwave {

// Log levels
enum class LogLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG = 4,
    TRACE = 5
};

// Global log level - can be changed at runtime (CLI: -v / -q)
inline LogLevel g_log_level = LogLevel::INFO;

// Log category enable flags for fine-grained control
struct LogCategories {
    bool header = true;     // Header codec
    bool embed = true;      // Payload embedding
    bool extract = true;    // Payload extraction
    bool dsp = false;       // Per-chunk spectra and correlations (very verbose)
};

inline LogCategories g_log_categories;

// Set log level
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

// Convenience macros - these compile to nothing when STEGWAVE_LOG_DISABLE is defined
#ifdef STEGWAVE_LOG_DISABLE

#define LOG_ERROR(cat, fmt, ...)
#define LOG_WARN(cat, fmt, ...)
#define LOG_INFO(cat, fmt, ...)
#define LOG_DEBUG(cat, fmt, ...)
#define LOG_TRACE(cat, fmt, ...)

#else

#define LOG_ERROR(cat, fmt, ...) \
    stegwave::log(stegwave::LogLevel::ERROR, cat, fmt, ##__VA_ARGS__)

#define LOG_WARN(cat, fmt, ...) \
    stegwave::log(stegwave::LogLevel::WARN, cat, fmt, ##__VA_ARGS__)

#define LOG_INFO(cat, fmt, ...) \
    stegwave::log(stegwave::LogLevel::INFO, cat, fmt, ##__VA_ARGS__)

#define LOG_DEBUG(cat, fmt, ...) \
    do { if (stegwave::g_log_level >= stegwave::LogLevel::DEBUG) \
        stegwave::log(stegwave::LogLevel::DEBUG, cat, fmt, ##__VA_ARGS__); } while(0)

#define LOG_TRACE(cat, fmt, ...) \
    do { if (stegwave::g_log_level >= stegwave::LogLevel::TRACE) \
        stegwave::log(stegwave::LogLevel::TRACE, cat, fmt, ##__VA_ARGS__); } while(0)

#endif

// Category-specific logging macros
#define LOG_HEADER(level, fmt, ...) \
    do { if (stegwave::g_log_categories.header) LOG_##level("HEADER", fmt, ##__VA_ARGS__); } while(0)

#define LOG_EMBED(level, fmt, ...) \
    do { if (stegwave::g_log_categories.embed) LOG_##level("EMBED", fmt, ##__VA_ARGS__); } while(0)

#define LOG_EXTRACT(level, fmt, ...) \
    do { if (stegwave::g_log_categories.extract) LOG_##level("EXTRACT", fmt, ##__VA_ARGS__); } while(0)

#define LOG_DSP(level, fmt, ...) \
    do { if (stegwave::g_log_categories.dsp) LOG_##level("DSP", fmt, ##__VA_ARGS__); } while(0)

} // namespace stegwave
