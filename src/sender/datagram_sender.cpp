#include "sender/datagram_sender.h"
#include "sender/stream_sender.h"
#include "clock/iclock.h"
#include "core/errors.h"
#include "transport/i_transport.h"
#include "util/log.h"
#include "wire/wire_format.h"

#include <string>

namespace flowbench {

DatagramSender::DatagramSender(IConnection& conn, IClock& clock, uint32_t chunk_size)
    : conn_(conn), clock_(clock)
{
    const size_t unit = wire::kDatagramHeaderSize + chunk_size;
    if (unit > conn.maxDatagramSize())
        throw ConfigError("DatagramSender: " + std::to_string(chunk_size) +
                          "-byte chunks need " + std::to_string(unit) +
                          "-byte datagrams, connection allows " +
                          std::to_string(conn.maxDatagramSize()));
}

SendOutcome DatagramSender::emit(const Chunk& chunk, uint64_t /*scheduled_ns*/) {
    SendOutcome out;
    out.actual_ns = clock_.nowNs();

    const std::vector<uint8_t> unit = wire::encodeDatagram(chunk, out.actual_ns);
    out.wire_bytes = unit.size();

    const DatagramResult r = conn_.sendDatagram(unit.data(), unit.size());
    if (r == DatagramResult::SENT) {
        out.status = SendStatus::OK;
        return out;
    }

    ++dropped_;
    logf(LogLevel::WARN, "DatagramSender: seq %llu dropped at source (%s)",
         static_cast<unsigned long long>(chunk.seq), datagramResultName(r));
    out.status = SendStatus::DROPPED;
    return out;
}

void DatagramSender::finish() {
    conn_.finish();
}

std::unique_ptr<IUnitSender> makeUnitSender(TransportMode mode, IConnection& conn,
                                            IClock& clock, uint32_t chunk_size) {
    if (mode == TransportMode::STREAM)
        return std::make_unique<StreamSender>(conn, clock);
    return std::make_unique<DatagramSender>(conn, clock, chunk_size);
}

}  // namespace flowbench
