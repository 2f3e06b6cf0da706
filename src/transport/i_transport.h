#pragma once

#include "core/event_types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace flowbench {

/// Result of one unreliable send. Only SENT means the unit left the host;
/// everything else is a per-unit failure the caller logs and moves past.
enum class DatagramResult : uint8_t {
    SENT = 0,
    WOULD_BLOCK,   // local buffer full
    TOO_LARGE,     // exceeds the negotiated maximum datagram size
    FAILED         // transport refused the unit
};

inline const char* datagramResultName(DatagramResult r) {
    switch (r) {
        case DatagramResult::SENT:        return "sent";
        case DatagramResult::WOULD_BLOCK: return "would block";
        case DatagramResult::TOO_LARGE:   return "too large";
        case DatagramResult::FAILED:      return "failed";
    }
    return "unknown";
}

struct ConnectParams {
    std::string   host;
    uint16_t      port = 0;
    TransportMode mode = TransportMode::DATAGRAM;
    std::string   cca;                        // congestion-control label, passed through
    uint32_t      max_datagram_size = 65535;  // local upper bound for negotiation
    uint32_t      connect_timeout_ms = 3000;
};

/// Client side of one flow: one ordered reliable stream plus an unreliable
/// datagram channel on the same connection.
class IConnection {
public:
    virtual ~IConnection() = default;

    /// Flow id assigned by the server for this connection.
    virtual uint64_t id() const = 0;
    virtual std::string peer() const = 0;
    /// Largest datagram payload the peer agreed to accept.
    virtual size_t maxDatagramSize() const = 0;

    /// Blocks until every byte is accepted by the transport; partial writes
    /// are continued internally. Throws TransportError on failure.
    virtual void streamWrite(const uint8_t* data, size_t len) = 0;

    /// Never blocks, never retries.
    virtual DatagramResult sendDatagram(const uint8_t* data, size_t len) = 0;

    /// Signals end of data (stream half-close). Idempotent.
    virtual void finish() = 0;
    /// Releases transport resources. Idempotent.
    virtual void close() = 0;
};

class IConnector {
public:
    virtual ~IConnector() = default;
    /// Throws ConnectError when the connection cannot be established.
    virtual std::unique_ptr<IConnection> connect(const ConnectParams& params) = 0;
};

/// What the client announced when it opened the connection.
struct ClientHello {
    TransportMode mode = TransportMode::DATAGRAM;
    std::string   cca;
    uint32_t      max_datagram_size = 0;
};

enum class ArrivalKind : uint8_t {
    STREAM_DATA = 0,   // bytes from the ordered stream (no frame boundaries)
    STREAM_FIN,        // peer half-closed the stream
    DATAGRAM,          // one whole datagram
    TIMEOUT,           // nothing arrived within the poll timeout
    CLOSED,            // connection gone, nothing further can arrive
    ERROR              // fatal transport error (see Arrival::error)
};

struct Arrival {
    ArrivalKind kind = ArrivalKind::TIMEOUT;
    uint64_t    recv_ns = 0;        // stamped by the transport on arrival
    std::vector<uint8_t> data;
    std::string error;
};

/// Server side of one flow.
class IInboundConnection {
public:
    virtual ~IInboundConnection() = default;

    virtual uint64_t id() const = 0;
    virtual std::string peer() const = 0;
    virtual const ClientHello& hello() const = 0;

    /// Waits up to timeout_ms for the next arrival and returns its kind.
    virtual ArrivalKind poll(uint32_t timeout_ms, Arrival& out) = 0;

    virtual void close() = 0;
};

class IListener {
public:
    virtual ~IListener() = default;
    /// Returns the next established inbound connection, or nullptr when none
    /// arrived within timeout_ms.
    virtual std::unique_ptr<IInboundConnection> accept(uint32_t timeout_ms) = 0;
    virtual void close() = 0;
};

}  // namespace flowbench
