#pragma once

#include <string>

namespace flowbench {

enum class LogLevel : int {
    ERROR = 0,
    WARN  = 1,
    INFO  = 2,
    DEBUG = 3
};

/// Process-wide verbosity for diagnostic messages (default INFO).
/// Event records never go through here; they go to the flow's sinks.
void setLogLevel(LogLevel level);
LogLevel logLevel();

/// Accepts error|warn|info|debug (case-insensitive). Returns false otherwise.
bool parseLogLevel(const std::string& s, LogLevel& out);

/// printf-style message to stderr, prefixed with wall time and level,
/// dropped when level is above the current verbosity.
void logf(LogLevel level, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

inline bool logEnabled(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(logLevel());
}

}  // namespace flowbench
