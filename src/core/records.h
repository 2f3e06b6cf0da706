#pragma once

#include "core/event_types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace flowbench {

// --- Chunk: one sequence-numbered unit of application payload ---
struct Chunk {
    uint64_t seq = 0;
    bool     last = false;       // final chunk of the input
    std::vector<uint8_t> bytes;  // length <= configured chunk size
};

// --- EventRecord (fixed width, packed) ---
// One Send or Receive Event. Send events use scheduled_ns/ts_ns (actual send
// time) and status; receive events use ts_ns (receive time) and send_ts_ns
// (sender timestamp embedded in datagrams, 0 for stream units).
// All times are nanoseconds since the Unix epoch.
#pragma pack(push, 1)
struct EventRecord {
    uint64_t flow_id;
    uint64_t seq;
    uint64_t scheduled_ns;
    uint64_t ts_ns;
    uint64_t send_ts_ns;
    uint32_t bytes;
    uint8_t  kind;      // EventKind
    uint8_t  mode;      // TransportMode
    uint8_t  status;    // SendStatus
    uint8_t  reserved;
};
#pragma pack(pop)
static_assert(sizeof(EventRecord) == 48, "EventRecord must be 48 bytes");

// --- FlowMeta: per-flow constants written once into every log ---
struct FlowMeta {
    uint64_t      flow_id = 0;
    LogRole       role = LogRole::SENDER;
    TransportMode mode = TransportMode::DATAGRAM;
    std::string   cca;                 // congestion-control label, opaque
    uint64_t      target_bitrate_bps = 0;  // 0 on the receiver side
    uint32_t      chunk_bytes = 0;         // 0 on the receiver side
};

inline EventRecord makeSendRecord(uint64_t flow_id, uint64_t seq, TransportMode mode,
                                  uint32_t bytes, uint64_t scheduled_ns,
                                  uint64_t actual_ns, SendStatus status) {
    EventRecord r{};
    r.flow_id      = flow_id;
    r.seq          = seq;
    r.scheduled_ns = scheduled_ns;
    r.ts_ns        = actual_ns;
    r.send_ts_ns   = 0;
    r.bytes        = bytes;
    r.kind         = static_cast<uint8_t>(EventKind::SEND);
    r.mode         = static_cast<uint8_t>(mode);
    r.status       = static_cast<uint8_t>(status);
    return r;
}

inline EventRecord makeRecvRecord(uint64_t flow_id, uint64_t seq, TransportMode mode,
                                  uint32_t bytes, uint64_t recv_ns, uint64_t send_ts_ns) {
    EventRecord r{};
    r.flow_id      = flow_id;
    r.seq          = seq;
    r.scheduled_ns = 0;
    r.ts_ns        = recv_ns;
    r.send_ts_ns   = send_ts_ns;
    r.bytes        = bytes;
    r.kind         = static_cast<uint8_t>(EventKind::RECV);
    r.mode         = static_cast<uint8_t>(mode);
    r.status       = static_cast<uint8_t>(SendStatus::OK);
    return r;
}

}  // namespace flowbench
