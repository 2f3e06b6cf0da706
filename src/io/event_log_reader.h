#pragma once

#include "io/event_log_format.h"
#include "core/records.h"

#include <cstdio>
#include <string>
#include <vector>

namespace flowbench {

/// Reads binary event logs produced by BinaryFileSink.
/// Supports sequential iteration and random access by chunk index. Files
/// left without an index (process killed before close) are recovered by
/// scanning chunk headers.
class EventLogReader {
public:
    /// Opens the file and parses the file header.
    /// Throws std::runtime_error if the file cannot be opened or the header is invalid.
    explicit EventLogReader(const std::string& path);

    ~EventLogReader();

    EventLogReader(const EventLogReader&) = delete;
    EventLogReader& operator=(const EventLogReader&) = delete;

    const FileHeader& header() const { return header_; }
    FlowMeta meta() const { return flowMetaFromHeader(header_); }

    uint32_t chunkCount() const { return static_cast<uint32_t>(index_.size()); }
    uint64_t totalRecords() const;
    /// Dropped send events, from the index alone.
    uint64_t totalDropped() const;

    /// Read and decompress a single chunk by index (0-based).
    /// Throws std::out_of_range if idx >= chunkCount().
    std::vector<EventRecord> readChunk(uint32_t idx) const;

    /// Read and decompress all records sequentially.
    std::vector<EventRecord> readAll() const;

    /// Records with lo <= seq <= hi in file order. Only chunks whose span
    /// overlaps the range are decompressed.
    std::vector<EventRecord> readSeqRange(uint64_t lo, uint64_t hi) const;

    const std::vector<IndexEntry>& index() const { return index_; }

    /// True when the index came from a chunk scan rather than the footer.
    bool recovered() const { return recovered_; }

private:
    void buildIndex();
    void buildIndexFromFooter();
    /// Slow path / crash recovery: stops at the first incomplete chunk.
    void buildIndexByScanning();

    std::vector<EventRecord> decompressChunkAt(uint64_t file_offset) const;

    std::string path_;
    std::FILE* file_ = nullptr;
    long file_size_ = 0;
    FileHeader header_{};
    std::vector<IndexEntry> index_;
    bool recovered_ = false;
};

}  // namespace flowbench
