#include "io/event_log_format.h"

#include <algorithm>

namespace flowbench {

ChunkSpan spanOf(const std::vector<EventRecord>& records) {
    ChunkSpan s{};
    if (records.empty())
        return s;
    s.min_seq = records.front().seq;
    s.max_seq = records.front().seq;
    s.first_ts_ns = records.front().ts_ns;
    s.last_ts_ns = records.back().ts_ns;
    s.record_count = static_cast<uint32_t>(records.size());
    for (const auto& r : records) {
        s.min_seq = std::min(s.min_seq, r.seq);
        s.max_seq = std::max(s.max_seq, r.seq);
        if (r.kind == static_cast<uint8_t>(EventKind::SEND) &&
            r.status == static_cast<uint8_t>(SendStatus::DROPPED))
            ++s.dropped;
    }
    return s;
}

FlowMeta flowMetaFromHeader(const FileHeader& h) {
    FlowMeta meta;
    meta.flow_id = h.flow_id;
    meta.role = h.role == static_cast<uint8_t>(LogRole::RECEIVER) ? LogRole::RECEIVER
                                                                  : LogRole::SENDER;
    meta.mode = h.mode == static_cast<uint8_t>(TransportMode::STREAM) ? TransportMode::STREAM
                                                                      : TransportMode::DATAGRAM;
    const char* end = std::find(h.cca, h.cca + kHeaderCcaSize, '\0');
    meta.cca.assign(h.cca, end);
    meta.target_bitrate_bps = h.target_bitrate_bps;
    meta.chunk_bytes = h.chunk_bytes;
    return meta;
}

}  // namespace flowbench
