#pragma once

#include "core/records.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace flowbench {
namespace wire {

// --- Stream frame (16-byte header, big-endian) ---
//   magic "FBSF" (4) | seq u64 | len u32 | payload[len]
constexpr uint8_t  kStreamMagic[4]         = {'F', 'B', 'S', 'F'};
constexpr size_t   kStreamHeaderSize       = 16;
constexpr uint32_t kMaxStreamFramePayload  = 16u * 1024u * 1024u;

// --- Datagram unit (32-byte header, big-endian) ---
//   magic "FBDG" (4) | flags u8 | reserved[3] | seq u64 | send_ts_ns u64 |
//   len u32 | reserved u32 | payload[len]
constexpr uint8_t kDatagramMagic[4]   = {'F', 'B', 'D', 'G'};
constexpr size_t  kDatagramHeaderSize = 32;
constexpr uint8_t kDatagramFlagLast   = 0x1;

enum class ParseError : uint8_t {
    NONE = 0,
    TOO_SHORT,
    BAD_MAGIC,
    LENGTH_MISMATCH,
    LENGTH_TOO_LARGE
};

const char* parseErrorName(ParseError e);

/// Writes the 16-byte stream frame header into dst.
void encodeStreamHeader(uint8_t* dst, uint64_t seq, uint32_t len);

/// Header plus payload, ready for one stream write.
std::vector<uint8_t> encodeStreamFrame(const Chunk& chunk);

/// One self-contained datagram: header (with send timestamp) plus payload.
std::vector<uint8_t> encodeDatagram(const Chunk& chunk, uint64_t send_ts_ns);

/// Decoded datagram. payload points into the buffer given to decodeDatagram.
struct DatagramUnit {
    uint64_t       seq = 0;
    uint64_t       send_ts_ns = 0;
    bool           last = false;
    const uint8_t* payload = nullptr;
    uint32_t       len = 0;
};

/// Parses one datagram. The declared length must equal the bytes that
/// follow the header exactly; anything else is rejected.
ParseError decodeDatagram(const uint8_t* data, size_t len, DatagramUnit& out);

}  // namespace wire
}  // namespace flowbench
