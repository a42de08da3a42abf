#pragma once

#include <string>

namespace mpupload {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

/// Minimum level that is written. Defaults to Info.
void set_log_level(LogLevel level);
LogLevel log_level();

// printf-style loggers. Debug/info go to stdout, warn/error to stderr.
// Each line is prefixed with a local timestamp and the level name.
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

/// printf into a string of whatever length the arguments need.
std::string format_message(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

/// Format a duration in seconds as "HHh MMm SSs".
std::string format_duration(double seconds);

}  // namespace mpupload
