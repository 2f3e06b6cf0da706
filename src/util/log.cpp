#include "util/log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>

namespace flowbench {

static std::atomic<int> g_log_level{static_cast<int>(LogLevel::INFO)};

void setLogLevel(LogLevel level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel logLevel() {
    return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

bool parseLogLevel(const std::string& s, LogLevel& out) {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "error")                          out = LogLevel::ERROR;
    else if (lower == "warn" || lower == "warning") out = LogLevel::WARN;
    else if (lower == "info")                      out = LogLevel::INFO;
    else if (lower == "debug" || lower == "trace") out = LogLevel::DEBUG;
    else return false;
    return true;
}

static const char* levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "?????";
}

void logf(LogLevel level, const char* fmt, ...) {
    if (!logEnabled(level))
        return;

    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;

    std::tm tm{};
    gmtime_r(&secs, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &tm);

    // Format into one buffer so concurrent flows do not interleave mid-line.
    char line[1024];
    int n = std::snprintf(line, sizeof(line), "[%s.%06lldZ] [%s] ",
                          stamp, static_cast<long long>(micros), levelTag(level));
    if (n < 0) n = 0;

    va_list args;
    va_start(args, fmt);
    const size_t used = static_cast<size_t>(n) < sizeof(line) ? static_cast<size_t>(n) : sizeof(line) - 1;
    std::vsnprintf(line + used, sizeof(line) - used, fmt, args);
    va_end(args);

    std::fprintf(stderr, "%s\n", line);
}

}  // namespace flowbench
