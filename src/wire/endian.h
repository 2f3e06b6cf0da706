#pragma once

#include <cstdint>

namespace flowbench {
namespace wire {

// Wire units are big-endian. Byte-wise stores keep them alignment-free,
// so headers can be written straight into a payload buffer at any offset.

inline void store16be(uint8_t* dst, uint16_t v) {
    dst[0] = static_cast<uint8_t>(v >> 8);
    dst[1] = static_cast<uint8_t>(v);
}

inline void store32be(uint8_t* dst, uint32_t v) {
    dst[0] = static_cast<uint8_t>(v >> 24);
    dst[1] = static_cast<uint8_t>(v >> 16);
    dst[2] = static_cast<uint8_t>(v >> 8);
    dst[3] = static_cast<uint8_t>(v);
}

inline void store64be(uint8_t* dst, uint64_t v) {
    store32be(dst, static_cast<uint32_t>(v >> 32));
    store32be(dst + 4, static_cast<uint32_t>(v));
}

inline uint16_t load16be(const uint8_t* src) {
    return static_cast<uint16_t>((static_cast<uint16_t>(src[0]) << 8) | src[1]);
}

inline uint32_t load32be(const uint8_t* src) {
    return (static_cast<uint32_t>(src[0]) << 24) |
           (static_cast<uint32_t>(src[1]) << 16) |
           (static_cast<uint32_t>(src[2]) << 8)  |
            static_cast<uint32_t>(src[3]);
}

inline uint64_t load64be(const uint8_t* src) {
    return (static_cast<uint64_t>(load32be(src)) << 32) | load32be(src + 4);
}

}  // namespace wire
}  // namespace flowbench
