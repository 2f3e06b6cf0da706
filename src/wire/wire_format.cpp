#include "wire/wire_format.h"
#include "wire/endian.h"

#include <cstring>
#include <stdexcept>

namespace flowbench {
namespace wire {

const char* parseErrorName(ParseError e) {
    switch (e) {
        case ParseError::NONE:             return "none";
        case ParseError::TOO_SHORT:        return "too short";
        case ParseError::BAD_MAGIC:        return "bad magic";
        case ParseError::LENGTH_MISMATCH:  return "length mismatch";
        case ParseError::LENGTH_TOO_LARGE: return "length too large";
    }
    return "unknown";
}

void encodeStreamHeader(uint8_t* dst, uint64_t seq, uint32_t len) {
    std::memcpy(dst, kStreamMagic, 4);
    store64be(dst + 4, seq);
    store32be(dst + 12, len);
}

std::vector<uint8_t> encodeStreamFrame(const Chunk& chunk) {
    if (chunk.bytes.size() > kMaxStreamFramePayload)
        throw std::invalid_argument("encodeStreamFrame: chunk exceeds maximum frame payload");

    const uint32_t len = static_cast<uint32_t>(chunk.bytes.size());
    std::vector<uint8_t> frame(kStreamHeaderSize + len);
    encodeStreamHeader(frame.data(), chunk.seq, len);
    if (len > 0)
        std::memcpy(frame.data() + kStreamHeaderSize, chunk.bytes.data(), len);
    return frame;
}

std::vector<uint8_t> encodeDatagram(const Chunk& chunk, uint64_t send_ts_ns) {
    const uint32_t len = static_cast<uint32_t>(chunk.bytes.size());
    std::vector<uint8_t> unit(kDatagramHeaderSize + len, 0);

    uint8_t* p = unit.data();
    std::memcpy(p, kDatagramMagic, 4);
    p[4] = chunk.last ? kDatagramFlagLast : 0;
    // p[5..7] reserved (zero)
    store64be(p + 8, chunk.seq);
    store64be(p + 16, send_ts_ns);
    store32be(p + 24, len);
    // p[28..31] reserved (zero)

    if (len > 0)
        std::memcpy(p + kDatagramHeaderSize, chunk.bytes.data(), len);
    return unit;
}

ParseError decodeDatagram(const uint8_t* data, size_t len, DatagramUnit& out) {
    if (len < kDatagramHeaderSize)
        return ParseError::TOO_SHORT;
    if (std::memcmp(data, kDatagramMagic, 4) != 0)
        return ParseError::BAD_MAGIC;

    const uint32_t declared = load32be(data + 24);
    if (static_cast<size_t>(declared) != len - kDatagramHeaderSize)
        return ParseError::LENGTH_MISMATCH;

    out.last       = (data[4] & kDatagramFlagLast) != 0;
    out.seq        = load64be(data + 8);
    out.send_ts_ns = load64be(data + 16);
    out.len        = declared;
    out.payload    = data + kDatagramHeaderSize;
    return ParseError::NONE;
}

}  // namespace wire
}  // namespace flowbench
