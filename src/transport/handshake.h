#pragma once

#include "transport/i_transport.h"

#include <cstddef>
#include <cstdint>

namespace flowbench {

// Socket-binding handshake, sent on the TCP connection before any stream
// data (big-endian):
//
//   Hello    = "FBHS" | version u16 | mode u8 | reserved u8 |
//              max_datagram u32 | cca[16]                         (28 bytes)
//   HelloAck = "FBHA" | version u16 | status u8 | reserved u8 |
//              flow_id u64 | max_datagram u32 | udp_port u16 |
//              reserved u16                                       (24 bytes)
//
// Every UDP datagram of the flow is then prefixed with the 8-byte flow id.

constexpr uint16_t kHandshakeVersion   = 1;
constexpr size_t   kHelloSize          = 28;
constexpr size_t   kHelloAckSize       = 24;
constexpr size_t   kCcaLabelMax        = 16;
constexpr size_t   kFlowIdPrefixSize   = 8;
// 65535 - 20 (IPv4) - 8 (UDP) - flow id prefix
constexpr uint32_t kMaxSocketDatagram  = 65507 - kFlowIdPrefixSize;

enum HelloStatus : uint8_t {
    kHelloAccepted = 0,
    kHelloRejected = 1
};

struct HelloAck {
    uint8_t  status = kHelloAccepted;
    uint64_t flow_id = 0;
    uint32_t max_datagram_size = 0;
    uint16_t udp_port = 0;
};

/// Throws ConfigError for a cca label longer than kCcaLabelMax.
void encodeHello(const ClientHello& hello, uint8_t* out);
/// Returns false on wrong magic or version.
bool decodeHello(const uint8_t* in, ClientHello& out);

void encodeHelloAck(const HelloAck& ack, uint8_t* out);
bool decodeHelloAck(const uint8_t* in, HelloAck& out);

}  // namespace flowbench
