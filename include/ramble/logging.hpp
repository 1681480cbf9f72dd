#pragma once

#include <chrono>
#include <cstdio>

#ifdef _WIN32
// Prevent Windows ERROR macro from corrupting LogLevel::ERROR
#ifdef ERROR
#undef ERROR
#endif
#endif

namespace ramble {

// Higher value = more verbose
enum class LogLevel : int {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4,
};

// Per-subsystem switches (all on by default)
struct LogCategories {
    bool link = true;     // Transport / radio link
    bool proto = true;    // Classifier, parser, transfer state, ACKs
    bool sync = true;     // Session orchestration
    bool store = true;    // Persistence
};

extern LogLevel g_log_level;
extern LogCategories g_log_categories;
extern std::chrono::steady_clock::time_point g_log_start_time;

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Redirect all output to an already-open file (nullptr = back to stderr).
// The logger does not take ownership.
void setLogFile(FILE* file);

// Optional tag printed after the category (e.g. device name in the simulator)
void setLogStationTag(const char* tag);

const char* logLevelToString(LogLevel level);
LogLevel stringToLogLevel(const char* str, LogLevel fallback = LogLevel::INFO);

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 3, 4)))
#endif
void log(LogLevel level, const char* category, const char* fmt, ...);

} // namespace ramble

#define RAMBLE_LOG_IMPL(enabled, cat, level, ...)                              \
    do {                                                                       \
        if ((enabled) && ::ramble::g_log_level >= ::ramble::LogLevel::level) { \
            ::ramble::log(::ramble::LogLevel::level, cat, __VA_ARGS__);        \
        }                                                                      \
    } while (0)

#define LOG_LINK(level, ...)  RAMBLE_LOG_IMPL(::ramble::g_log_categories.link, "LINK", level, __VA_ARGS__)
#define LOG_PROTO(level, ...) RAMBLE_LOG_IMPL(::ramble::g_log_categories.proto, "PROTO", level, __VA_ARGS__)
#define LOG_SYNC(level, ...)  RAMBLE_LOG_IMPL(::ramble::g_log_categories.sync, "SYNC", level, __VA_ARGS__)
#define LOG_STORE(level, ...) RAMBLE_LOG_IMPL(::ramble::g_log_categories.store, "STORE", level, __VA_ARGS__)
