#include "mpupload/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>

namespace mpupload {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

std::string vformat(const char* fmt, va_list args) {
    va_list sizing;
    va_copy(sizing, args);
    int needed = std::vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);
    if (needed <= 0) return {};

    std::string out(static_cast<size_t>(needed) + 1, '\0');
    std::vsnprintf(out.data(), out.size(), fmt, args);
    out.resize(static_cast<size_t>(needed));
    return out;
}

// Format the whole line first so concurrent workers never interleave output.
void vlog(LogLevel level, const char* fmt, va_list args) {
    if (level < g_level.load(std::memory_order_relaxed)) return;

    char stamp[32];
    std::time_t now = std::time(nullptr);
    std::tm tm;
    localtime_r(&now, &tm);
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);

    char prefix[64];
    std::snprintf(prefix, sizeof(prefix), "[%s] %8s ", stamp, level_name(level));

    std::string line = prefix + vformat(fmt, args) + "\n";

    FILE* out = (level >= LogLevel::Warn) ? stderr : stdout;
    std::fputs(line.c_str(), out);
    std::fflush(out);
}

}  // namespace

std::string format_message(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string out = vformat(fmt, args);
    va_end(args);
    return out;
}

void set_log_level(LogLevel level) {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel log_level() {
    return g_level.load(std::memory_order_relaxed);
}

void log_debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Debug, fmt, args);
    va_end(args);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Info, fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Warn, fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Error, fmt, args);
    va_end(args);
}

std::string format_duration(double seconds) {
    if (seconds < 0) seconds = 0;
    auto total = static_cast<long long>(seconds);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%02lldh %02lldm %02llds",
                  total / 3600, (total / 60) % 60, total % 60);
    return buf;
}

}  // namespace mpupload
