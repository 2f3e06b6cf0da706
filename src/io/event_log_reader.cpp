#include "io/event_log_reader.h"

#include <lz4.h>

#include <cstring>
#include <stdexcept>

namespace flowbench {

EventLogReader::EventLogReader(const std::string& path)
    : path_(path)
{
    file_ = std::fopen(path.c_str(), "rb");
    if (!file_)
        throw std::runtime_error("EventLogReader: cannot open " + path);

    std::fseek(file_, 0, SEEK_END);
    file_size_ = std::ftell(file_);
    std::fseek(file_, 0, SEEK_SET);

    try {
        if (std::fread(&header_, sizeof(header_), 1, file_) != 1)
            throw std::runtime_error("EventLogReader: cannot read header from " + path);

        if (!validateMagic(header_))
            throw std::runtime_error("EventLogReader: invalid magic in " + path);

        if (header_.version_major != kLogVersionMajor)
            throw std::runtime_error("EventLogReader: unsupported version in " + path);

        if (header_.record_size != sizeof(EventRecord))
            throw std::runtime_error("EventLogReader: record size mismatch in " + path);

        buildIndex();
    } catch (...) {
        std::fclose(file_);
        file_ = nullptr;
        throw;
    }
}

EventLogReader::~EventLogReader() {
    if (file_)
        std::fclose(file_);
}

uint64_t EventLogReader::totalRecords() const {
    uint64_t total = 0;
    for (const auto& entry : index_)
        total += entry.span.record_count;
    return total;
}

uint64_t EventLogReader::totalDropped() const {
    uint64_t total = 0;
    for (const auto& entry : index_)
        total += entry.span.dropped;
    return total;
}

std::vector<EventRecord> EventLogReader::readChunk(uint32_t idx) const {
    if (idx >= chunkCount())
        throw std::out_of_range("EventLogReader: chunk index out of range");
    return decompressChunkAt(index_[idx].file_offset);
}

std::vector<EventRecord> EventLogReader::readAll() const {
    std::vector<EventRecord> result;
    result.reserve(static_cast<size_t>(totalRecords()));
    for (uint32_t i = 0; i < chunkCount(); ++i) {
        auto chunk = readChunk(i);
        result.insert(result.end(), chunk.begin(), chunk.end());
    }
    return result;
}

std::vector<EventRecord> EventLogReader::readSeqRange(uint64_t lo, uint64_t hi) const {
    std::vector<EventRecord> result;
    for (const auto& entry : index_) {
        if (!spanOverlaps(entry.span, lo, hi))
            continue;
        for (const auto& rec : decompressChunkAt(entry.file_offset)) {
            if (rec.seq >= lo && rec.seq <= hi)
                result.push_back(rec);
        }
    }
    return result;
}

void EventLogReader::buildIndex() {
    if (header_.header_flags & kHeaderFlagHasIndex) {
        buildIndexFromFooter();
    } else {
        buildIndexByScanning();
        recovered_ = true;
    }
}

void EventLogReader::buildIndexFromFooter() {
    std::fseek(file_, -static_cast<long>(sizeof(IndexTail)), SEEK_END);

    IndexTail tail{};
    if (std::fread(&tail, sizeof(tail), 1, file_) != 1)
        throw std::runtime_error("EventLogReader: cannot read index tail");

    if (std::memcmp(tail.index_magic, kIndexMagic, 4) != 0)
        throw std::runtime_error("EventLogReader: invalid index magic");

    std::fseek(file_, static_cast<long>(tail.index_start_offset), SEEK_SET);
    index_.resize(tail.chunk_count);
    if (std::fread(index_.data(), sizeof(IndexEntry), tail.chunk_count, file_) != tail.chunk_count)
        throw std::runtime_error("EventLogReader: cannot read index entries");
}

void EventLogReader::buildIndexByScanning() {
    std::fseek(file_, sizeof(FileHeader), SEEK_SET);

    while (true) {
        const long chunk_offset = std::ftell(file_);

        ChunkHeader chdr{};
        if (std::fread(&chdr, sizeof(chdr), 1, file_) != 1)
            break;

        // A chunk cut short by a crash ends the scan.
        const long end = chunk_offset + static_cast<long>(sizeof(chdr)) +
                         static_cast<long>(chdr.compressed_size);
        if (chdr.span.record_count == 0 ||
            chdr.uncompressed_size != chdr.span.record_count * sizeof(EventRecord) ||
            end > file_size_)
            break;

        IndexEntry entry{};
        entry.file_offset = static_cast<uint64_t>(chunk_offset);
        entry.span = chdr.span;
        index_.push_back(entry);

        std::fseek(file_, end, SEEK_SET);
    }
}

std::vector<EventRecord> EventLogReader::decompressChunkAt(uint64_t file_offset) const {
    std::fseek(file_, static_cast<long>(file_offset), SEEK_SET);

    ChunkHeader chdr{};
    if (std::fread(&chdr, sizeof(chdr), 1, file_) != 1)
        throw std::runtime_error("EventLogReader: cannot read chunk header");

    if (chdr.uncompressed_size != chdr.span.record_count * sizeof(EventRecord))
        throw std::runtime_error("EventLogReader: chunk size does not match record count");

    std::vector<char> compressed(chdr.compressed_size);
    if (std::fread(compressed.data(), 1, chdr.compressed_size, file_) != chdr.compressed_size)
        throw std::runtime_error("EventLogReader: cannot read compressed payload");

    std::vector<EventRecord> records(chdr.span.record_count);
    const int result = LZ4_decompress_safe(
        compressed.data(),
        reinterpret_cast<char*>(records.data()),
        static_cast<int>(chdr.compressed_size),
        static_cast<int>(chdr.uncompressed_size));

    if (result != static_cast<int>(chdr.uncompressed_size))
        throw std::runtime_error("EventLogReader: LZ4 decompression failed");

    return records;
}

}  // namespace flowbench
