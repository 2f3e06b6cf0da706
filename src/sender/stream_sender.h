#pragma once

#include "sender/i_unit_sender.h"

#include <vector>

namespace flowbench {

/// Writes each chunk as one stream frame on the connection's ordered stream.
/// The write returns once the transport accepted every byte, so under flow
/// control the actual send time trails the schedule. A write failure
/// propagates as TransportError and ends the flow.
class StreamSender : public IUnitSender {
public:
    StreamSender(IConnection& conn, IClock& clock);

    SendOutcome emit(const Chunk& chunk, uint64_t scheduled_ns) override;
    void finish() override;
    TransportMode mode() const override { return TransportMode::STREAM; }

private:
    IConnection& conn_;
    IClock& clock_;
    std::vector<uint8_t> frame_;
};

}  // namespace flowbench
