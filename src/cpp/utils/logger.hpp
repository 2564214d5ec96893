#pragma once
// printf-style logger shared by all plantop components.
// Logs go to stderr unless redirected with set_log_file(); the console sink
// owns stdout, so a dashboard run usually sends logs to a file.
#include <cstdio>
#include <cstdarg>
#include <chrono>
#include <ctime>
#include <string>
#include <strings.h>

namespace plantop {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

inline LogLevel g_log_level = LogLevel::INFO;
inline std::FILE* g_log_stream = nullptr;  // nullptr = stderr

// Accepts "debug", "info", "warn"/"warning", "error" (case-insensitive).
// Returns false and leaves `out` untouched on anything else.
inline bool parse_log_level(const std::string& s, LogLevel& out) {
    if (strcasecmp(s.c_str(), "debug") == 0) { out = LogLevel::DEBUG; return true; }
    if (strcasecmp(s.c_str(), "info") == 0)  { out = LogLevel::INFO;  return true; }
    if (strcasecmp(s.c_str(), "warn") == 0 ||
        strcasecmp(s.c_str(), "warning") == 0) { out = LogLevel::WARN; return true; }
    if (strcasecmp(s.c_str(), "error") == 0) { out = LogLevel::ERROR; return true; }
    return false;
}

// Redirect log output to `path` (append mode). Returns false if the file
// cannot be opened; logging then stays on stderr.
inline bool set_log_file(const std::string& path) {
    std::FILE* f = std::fopen(path.c_str(), "a");
    if (!f) return false;
    if (g_log_stream) std::fclose(g_log_stream);
    g_log_stream = f;
    return true;
}

inline void close_log_file() {
    if (g_log_stream) {
        std::fclose(g_log_stream);
        g_log_stream = nullptr;
    }
}

inline void log(LogLevel level, const char* fmt, ...) {
    if (level < g_log_level) return;

    std::FILE* out = g_log_stream ? g_log_stream : stderr;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    struct tm tm_buf{};
    localtime_r(&t, &tm_buf);

    const char* prefix = "???";
    switch (level) {
        case LogLevel::DEBUG: prefix = "DBG"; break;
        case LogLevel::INFO:  prefix = "INF"; break;
        case LogLevel::WARN:  prefix = "WRN"; break;
        case LogLevel::ERROR: prefix = "ERR"; break;
    }

    std::fprintf(out, "[%04d-%02d-%02d %02d:%02d:%02d.%03d] [%s] ",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms),
        prefix);

    va_list args;
    va_start(args, fmt);
    std::vfprintf(out, fmt, args);
    va_end(args);
    std::fputc('\n', out);
    if (out != stderr) std::fflush(out);
}

#define LOG_DBG(...) ::plantop::log(::plantop::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INF(...) ::plantop::log(::plantop::LogLevel::INFO,  __VA_ARGS__)
#define LOG_WRN(...) ::plantop::log(::plantop::LogLevel::WARN,  __VA_ARGS__)
#define LOG_ERR(...) ::plantop::log(::plantop::LogLevel::ERROR, __VA_ARGS__)

} // namespace plantop
