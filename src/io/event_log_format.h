#pragma once

#include "core/records.h"

#include <cstdint>
#include <cstring>
#include <vector>

namespace flowbench {

// Binary flow log (.fblog), little-endian host layout:
//
//   FileHeader (64)
//   { ChunkHeader (48) | LZ4(EventRecord[record_count]) } *
//   IndexEntry[chunk_count] (48 each) | IndexTail (16)      written on close
//
// HAS_INDEX is set in the header only after the footer is complete, so a
// file from a killed process is read by scanning chunk headers.

constexpr char     kLogMagic[8] = {'F','B','E','N','C','H','L','G'};
constexpr uint16_t kLogVersionMajor = 1;
constexpr uint16_t kLogVersionMinor = 0;
constexpr uint32_t kDefaultChunkCapacity = 4096;
constexpr size_t   kHeaderCcaSize = 16;

constexpr uint32_t kHeaderFlagHasIndex = 0x1;

#pragma pack(push, 1)
struct FileHeader {
    char     magic[8];
    uint16_t version_major;
    uint16_t version_minor;
    uint32_t record_size;
    uint64_t flow_id;
    uint8_t  role;              // LogRole
    uint8_t  mode;              // TransportMode
    uint16_t reserved;
    uint32_t chunk_capacity;
    uint32_t header_flags;
    uint64_t target_bitrate_bps;
    uint32_t chunk_bytes;
    char     cca[kHeaderCcaSize];   // NUL-padded, not necessarily terminated
};

/// What one chunk covers. Datagram logs can hold reordered sequence
/// numbers, so min/max rather than first/last.
struct ChunkSpan {
    uint64_t min_seq;
    uint64_t max_seq;
    uint64_t first_ts_ns;
    uint64_t last_ts_ns;
    uint32_t record_count;
    uint32_t dropped;           // send events with status dropped
};

struct ChunkHeader {
    uint32_t  uncompressed_size;
    uint32_t  compressed_size;
    ChunkSpan span;
};

struct IndexEntry {
    uint64_t  file_offset;
    ChunkSpan span;
};

struct IndexTail {
    uint32_t chunk_count;
    char     index_magic[4];
    uint64_t index_start_offset;
};
#pragma pack(pop)

static_assert(sizeof(FileHeader) == 64, "FileHeader must be 64 bytes");
static_assert(sizeof(ChunkSpan) == 40, "ChunkSpan must be 40 bytes");
static_assert(sizeof(ChunkHeader) == 48, "ChunkHeader must be 48 bytes");
static_assert(sizeof(IndexEntry) == 48, "IndexEntry must be 48 bytes");
static_assert(sizeof(IndexTail) == 16, "IndexTail must be 16 bytes");

constexpr char kIndexMagic[4] = {'F','I','D','X'};

inline bool validateMagic(const FileHeader& h) {
    return std::memcmp(h.magic, kLogMagic, 8) == 0;
}

inline bool spanOverlaps(const ChunkSpan& s, uint64_t lo, uint64_t hi) {
    return s.record_count > 0 && s.min_seq <= hi && s.max_seq >= lo;
}

/// Span of a non-empty run of records.
ChunkSpan spanOf(const std::vector<EventRecord>& records);

FlowMeta flowMetaFromHeader(const FileHeader& h);

}  // namespace flowbench
