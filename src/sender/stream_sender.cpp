#include "sender/stream_sender.h"
#include "clock/iclock.h"
#include "transport/i_transport.h"
#include "wire/wire_format.h"

#include <cstring>

namespace flowbench {

StreamSender::StreamSender(IConnection& conn, IClock& clock)
    : conn_(conn), clock_(clock) {}

SendOutcome StreamSender::emit(const Chunk& chunk, uint64_t /*scheduled_ns*/) {
    const size_t n = chunk.bytes.size();
    frame_.resize(wire::kStreamHeaderSize + n);
    wire::encodeStreamHeader(frame_.data(), chunk.seq, static_cast<uint32_t>(n));
    if (n > 0)
        std::memcpy(frame_.data() + wire::kStreamHeaderSize, chunk.bytes.data(), n);

    conn_.streamWrite(frame_.data(), frame_.size());

    SendOutcome out;
    out.status = SendStatus::OK;
    out.actual_ns = clock_.nowNs();
    out.wire_bytes = frame_.size();
    return out;
}

void StreamSender::finish() {
    conn_.finish();
}

}  // namespace flowbench
