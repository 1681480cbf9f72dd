#include "ramble/logging.hpp"

#include <cctype>
#include <cstdarg>
#include <mutex>
#include <string>

namespace ramble {

LogLevel g_log_level = LogLevel::INFO;
LogCategories g_log_categories;
std::chrono::steady_clock::time_point g_log_start_time = std::chrono::steady_clock::now();

static std::mutex g_log_mutex;
static FILE* g_log_file = nullptr;
static std::string g_station_tag;

void setLogLevel(LogLevel level) {
    g_log_level = level;
}

LogLevel getLogLevel() {
    return g_log_level;
}

void setLogFile(FILE* file) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_file = file;
}

void setLogStationTag(const char* tag) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_station_tag = tag ? tag : "";
}

const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "?";
    }
}

LogLevel stringToLogLevel(const char* str, LogLevel fallback) {
    if (!str) return fallback;
    std::string lower(str);
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "error") return LogLevel::ERROR;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "trace") return LogLevel::TRACE;
    return fallback;
}

void log(LogLevel level, const char* category, const char* fmt, ...) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - g_log_start_time).count();
    int secs = static_cast<int>(elapsed / 1000);
    int ms = static_cast<int>(elapsed % 1000);

    char buf[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    FILE* out = g_log_file ? g_log_file : stderr;
    if (g_station_tag.empty()) {
        fprintf(out, "[%3d.%03d][%-5s][%-5s] %s\n", secs, ms,
                logLevelToString(level), category ? category : "", buf);
    } else {
        fprintf(out, "[%3d.%03d][%-5s][%-5s][%s] %s\n", secs, ms,
                logLevelToString(level), category ? category : "",
                g_station_tag.c_str(), buf);
    }
    fflush(out);
}

} // namespace ramble
