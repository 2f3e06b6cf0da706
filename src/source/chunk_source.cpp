#include "source/chunk_source.h"
#include "core/errors.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace flowbench {

ChunkSource::ChunkSource(const std::string& path, uint32_t chunk_size)
    : path_(path), chunk_size_(chunk_size)
{
    namespace fs = std::filesystem;

    if (chunk_size_ == 0)
        throw ConfigError("ChunkSource: chunk size must be > 0");

    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        throw ConfigError("ChunkSource: not a readable regular file: " + path);

    total_bytes_ = static_cast<uint64_t>(fs::file_size(path, ec));
    if (ec)
        throw ConfigError("ChunkSource: cannot stat " + path + ": " + ec.message());

    file_ = std::fopen(path.c_str(), "rb");
    if (!file_)
        throw ConfigError("ChunkSource: cannot open " + path + ": " + std::strerror(errno));
}

ChunkSource::~ChunkSource() {
    if (file_)
        std::fclose(file_);
}

uint64_t ChunkSource::expectedChunks() const {
    return (total_bytes_ + chunk_size_ - 1) / chunk_size_;
}

bool ChunkSource::next(Chunk& out) {
    if (bytes_produced_ >= total_bytes_)
        return false;

    const uint64_t remaining = total_bytes_ - bytes_produced_;
    const size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, chunk_size_));

    out.bytes.resize(want);
    const size_t got = std::fread(out.bytes.data(), 1, want, file_);
    if (got != want) {
        const bool eof = std::feof(file_) != 0;
        out.bytes.clear();
        if (eof)
            throw InputError("ChunkSource: " + path_ + " shrank while reading (offset " +
                             std::to_string(bytes_produced_ + got) + ")");
        throw InputError("ChunkSource: read error on " + path_ + ": " + std::strerror(errno));
    }

    out.seq = next_seq_++;
    bytes_produced_ += want;
    out.last = (bytes_produced_ == total_bytes_);
    return true;
}

}  // namespace flowbench
