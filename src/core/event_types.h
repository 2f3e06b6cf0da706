#pragma once

#include <cstdint>
#include <string>

namespace flowbench {

/// Transport mode of a flow. One flow uses exactly one mode.
enum class TransportMode : uint8_t {
    STREAM = 0,
    DATAGRAM = 1
};

/// Which side of a flow produced an event record.
enum class EventKind : uint8_t {
    SEND = 0,
    RECV = 1
};

/// Outcome of one unit's transmission.
enum class SendStatus : uint8_t {
    OK = 0,
    DROPPED = 1   // datagram abandoned at source (local buffer full, transport refusal)
};

/// Role of the process writing a log.
enum class LogRole : uint8_t {
    SENDER = 0,
    RECEIVER = 1
};

inline const char* modeName(TransportMode m) {
    return m == TransportMode::STREAM ? "stream" : "datagram";
}

inline const char* kindName(EventKind k) {
    return k == EventKind::SEND ? "send" : "recv";
}

inline const char* statusName(SendStatus s) {
    return s == SendStatus::OK ? "ok" : "dropped";
}

/// Accepts "stream"/"str" and "datagram"/"dg" (case-insensitive).
/// Returns false for anything else.
bool parseMode(const std::string& s, TransportMode& out);

}  // namespace flowbench
