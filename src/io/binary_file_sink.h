#pragma once

#include "io/i_event_sink.h"
#include "io/event_log_format.h"
#include "core/records.h"

#include <cstdio>
#include <string>
#include <vector>

namespace flowbench {

/// Disk-backed event sink: writes EventRecords to a binary event log with
/// chunked LZ4 compression. The flow's constants go into the file header.
class BinaryFileSink : public IEventSink {
public:
    /// Opens the file and writes the file header. Throws std::runtime_error
    /// when the file cannot be created.
    /// chunk_capacity controls records per LZ4 chunk (default 4096).
    BinaryFileSink(const std::string& path,
                   const FlowMeta& meta,
                   uint32_t chunk_capacity = kDefaultChunkCapacity);

    ~BinaryFileSink() override;

    BinaryFileSink(const BinaryFileSink&) = delete;
    BinaryFileSink& operator=(const BinaryFileSink&) = delete;

    void append(const EventRecord& rec) override;

    /// Write buffered records as a partial chunk and flush the stream.
    void flush() override;

    /// Flush, write chunk index, finalise header flags, close file.
    /// Safe to call multiple times; subsequent calls are no-ops.
    void close() override;

    bool isOpen() const { return file_ != nullptr; }
    uint64_t recordsWritten() const { return total_records_; }
    uint64_t droppedWritten() const { return total_dropped_; }
    uint32_t chunksWritten() const { return static_cast<uint32_t>(index_.size()); }

private:
    void writeFileHeader(const FlowMeta& meta);
    void flushChunk();
    void writeIndex();
    void writeOrThrow(const void* data, size_t size, size_t count);

    std::string path_;
    std::FILE* file_ = nullptr;
    uint32_t chunk_capacity_;
    uint64_t total_records_ = 0;
    uint64_t total_dropped_ = 0;
    uint64_t offset_ = 0;           // next chunk's file offset

    std::vector<EventRecord> buffer_;
    std::vector<IndexEntry> index_;
    std::vector<char> compress_buf_;
};

}  // namespace flowbench
