#pragma once

#include "sender/i_unit_sender.h"

#include <cstdint>

namespace flowbench {

/// One datagram per chunk, stamped with its send time. Sends never block
/// and are never retried: a unit the transport refuses is logged and
/// reported DROPPED, and the sequence carries on.
class DatagramSender : public IUnitSender {
public:
    /// Throws ConfigError when header + chunk_size exceeds the
    /// connection's maximum datagram size.
    DatagramSender(IConnection& conn, IClock& clock, uint32_t chunk_size);

    SendOutcome emit(const Chunk& chunk, uint64_t scheduled_ns) override;
    void finish() override;
    TransportMode mode() const override { return TransportMode::DATAGRAM; }

    uint64_t dropped() const { return dropped_; }

private:
    IConnection& conn_;
    IClock& clock_;
    uint64_t dropped_ = 0;
};

}  // namespace flowbench
