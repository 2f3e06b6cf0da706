#include "io/binary_file_sink.h"
#include "util/log.h"

#include <lz4.h>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <stdexcept>

namespace flowbench {

BinaryFileSink::BinaryFileSink(const std::string& path,
                               const FlowMeta& meta,
                               uint32_t chunk_capacity)
    : path_(path), chunk_capacity_(chunk_capacity == 0 ? kDefaultChunkCapacity : chunk_capacity)
{
    file_ = std::fopen(path.c_str(), "wb");
    if (!file_)
        throw std::runtime_error("BinaryFileSink: cannot open " + path);

    buffer_.reserve(chunk_capacity_);

    const int max_compressed = LZ4_compressBound(
        static_cast<int>(chunk_capacity_ * sizeof(EventRecord)));
    compress_buf_.resize(static_cast<size_t>(max_compressed));

    writeFileHeader(meta);
}

BinaryFileSink::~BinaryFileSink() {
    if (!file_)
        return;
    try {
        close();
    } catch (const std::exception& e) {
        logf(LogLevel::ERROR, "BinaryFileSink: %s", e.what());
    }
}

void BinaryFileSink::append(const EventRecord& rec) {
    if (!file_)
        throw std::runtime_error("BinaryFileSink: append after close on " + path_);
    buffer_.push_back(rec);

    if (buffer_.size() >= chunk_capacity_)
        flushChunk();
}

void BinaryFileSink::flush() {
    if (!file_)
        return;
    if (!buffer_.empty())
        flushChunk();
    if (std::fflush(file_) != 0)
        throw std::runtime_error("BinaryFileSink: flush failed on " + path_);
}

void BinaryFileSink::close() {
    if (!file_)
        return;

    try {
        if (!buffer_.empty())
            flushChunk();
        writeIndex();
    } catch (...) {
        std::fclose(file_);
        file_ = nullptr;
        throw;
    }
    const int rc = std::fclose(file_);
    file_ = nullptr;
    if (rc != 0)
        throw std::runtime_error("BinaryFileSink: close failed on " + path_);
}

// --- Private ---

void BinaryFileSink::writeOrThrow(const void* data, size_t size, size_t count) {
    if (count == 0)
        return;
    if (std::fwrite(data, size, count, file_) != count)
        throw std::runtime_error("BinaryFileSink: write failed on " + path_);
}

void BinaryFileSink::writeFileHeader(const FlowMeta& meta) {
    FileHeader hdr{};
    std::memcpy(hdr.magic, kLogMagic, 8);
    hdr.version_major      = kLogVersionMajor;
    hdr.version_minor      = kLogVersionMinor;
    hdr.record_size        = static_cast<uint32_t>(sizeof(EventRecord));
    hdr.flow_id            = meta.flow_id;
    hdr.role               = static_cast<uint8_t>(meta.role);
    hdr.mode               = static_cast<uint8_t>(meta.mode);
    hdr.chunk_capacity     = chunk_capacity_;
    hdr.header_flags       = 0;
    hdr.target_bitrate_bps = meta.target_bitrate_bps;
    hdr.chunk_bytes        = meta.chunk_bytes;
    std::memcpy(hdr.cca, meta.cca.data(), std::min(meta.cca.size(), kHeaderCcaSize));

    writeOrThrow(&hdr, sizeof(hdr), 1);
    offset_ = sizeof(hdr);
}

void BinaryFileSink::flushChunk() {
    if (buffer_.empty())
        return;

    const uint32_t record_count = static_cast<uint32_t>(buffer_.size());
    const auto raw_bytes = static_cast<int>(record_count * sizeof(EventRecord));

    const int compressed_bytes = LZ4_compress_default(
        reinterpret_cast<const char*>(buffer_.data()),
        compress_buf_.data(),
        raw_bytes,
        static_cast<int>(compress_buf_.size()));

    if (compressed_bytes <= 0)
        throw std::runtime_error("BinaryFileSink: LZ4 compression failed");

    ChunkHeader chdr{};
    chdr.uncompressed_size = static_cast<uint32_t>(raw_bytes);
    chdr.compressed_size   = static_cast<uint32_t>(compressed_bytes);
    chdr.span              = spanOf(buffer_);

    IndexEntry entry{};
    entry.file_offset = offset_;
    entry.span        = chdr.span;

    writeOrThrow(&chdr, sizeof(chdr), 1);
    writeOrThrow(compress_buf_.data(), 1, static_cast<size_t>(compressed_bytes));
    offset_ += sizeof(chdr) + static_cast<uint64_t>(compressed_bytes);

    index_.push_back(entry);
    total_records_ += record_count;
    total_dropped_ += entry.span.dropped;
    buffer_.clear();
}

void BinaryFileSink::writeIndex() {
    if (index_.empty())
        return;

    const uint64_t index_start = static_cast<uint64_t>(offset_);

    writeOrThrow(index_.data(), sizeof(IndexEntry), index_.size());

    IndexTail tail{};
    tail.chunk_count        = static_cast<uint32_t>(index_.size());
    std::memcpy(tail.index_magic, kIndexMagic, 4);
    tail.index_start_offset = index_start;

    writeOrThrow(&tail, sizeof(tail), 1);

    // HAS_INDEX only once the index is complete on disk.
    if (std::fflush(file_) != 0 ||
        std::fseek(file_, static_cast<long>(offsetof(FileHeader, header_flags)), SEEK_SET) != 0)
        throw std::runtime_error("BinaryFileSink: cannot seek to header on " + path_);
    const uint32_t flags = kHeaderFlagHasIndex;
    writeOrThrow(&flags, sizeof(flags), 1);
    if (std::fseek(file_, 0, SEEK_END) != 0)
        throw std::runtime_error("BinaryFileSink: cannot seek to end on " + path_);
}

}  // namespace flowbench
