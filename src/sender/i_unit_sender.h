#pragma once

#include "core/event_types.h"
#include "core/records.h"
#include "pacing/rate_pacer.h"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace flowbench {

class IClock;
class IConnection;

/// Result of emitting one chunk.
struct SendOutcome {
    SendStatus status = SendStatus::OK;
    uint64_t   actual_ns = 0;    // when the unit left the sender
    size_t     wire_bytes = 0;   // header + payload
};

/// Emits chunks over one transport mode of one connection. Selected once
/// per flow; both implementations frame each chunk with its sequence number.
class IUnitSender {
public:
    virtual ~IUnitSender() = default;

    /// Sends one chunk whose pacer deadline was scheduled_ns.
    virtual SendOutcome emit(const Chunk& chunk, uint64_t scheduled_ns) = 0;

    /// Signals end of data to the peer.
    virtual void finish() = 0;

    virtual TransportMode mode() const = 0;
    PacingPolicy policy() const { return policyFor(mode()); }
};

/// StreamSender or DatagramSender for mode. Throws ConfigError when a
/// datagram of chunk_size bytes cannot fit the connection.
std::unique_ptr<IUnitSender> makeUnitSender(TransportMode mode, IConnection& conn,
                                            IClock& clock, uint32_t chunk_size);

}  // namespace flowbench
