#pragma once

#include "core/records.h"

#include <cstdint>
#include <cstdio>
#include <string>

namespace flowbench {

/// Lazily cuts an input file into sequence-numbered chunks of at most
/// chunk_size bytes. Sequence numbers start at 0 and increase by exactly 1;
/// only the last chunk may be short. End of input ends the sequence.
/// Restart by constructing a new source over the same path.
class ChunkSource {
public:
    /// Throws ConfigError if chunk_size is 0 or the file cannot be opened
    /// as a regular file.
    ChunkSource(const std::string& path, uint32_t chunk_size);
    ~ChunkSource();

    ChunkSource(const ChunkSource&) = delete;
    ChunkSource& operator=(const ChunkSource&) = delete;

    /// Fills out with the next chunk. Returns false at end of input.
    /// Throws InputError if the file cannot be read; no partial chunk is
    /// ever returned.
    bool next(Chunk& out);

    uint64_t totalBytes() const { return total_bytes_; }
    /// ceil(totalBytes / chunkSize)
    uint64_t expectedChunks() const;
    uint64_t chunksProduced() const { return next_seq_; }
    uint64_t bytesProduced() const { return bytes_produced_; }
    uint32_t chunkSize() const { return chunk_size_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::FILE*  file_ = nullptr;
    uint32_t    chunk_size_;
    uint64_t    total_bytes_ = 0;
    uint64_t    bytes_produced_ = 0;
    uint64_t    next_seq_ = 0;
};

}  // namespace flowbench
