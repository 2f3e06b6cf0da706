#include "wire/stream_reassembler.h"
#include "wire/endian.h"

#include <algorithm>
#include <cstring>

namespace flowbench {
namespace wire {

StreamReassembler::StreamReassembler(uint32_t max_payload)
    : max_payload_(max_payload)
{
    buffer_.reserve(64 * 1024);
}

size_t StreamReassembler::feed(const uint8_t* data, size_t len,
                               const FrameCallback& on_frame,
                               const ErrorCallback& on_error)
{
    buffer_.insert(buffer_.end(), data, data + len);

    size_t emitted = 0;
    while (true) {
        const size_t avail = buffer_.size() - cursor_;
        if (avail < sizeof(kStreamMagic))
            break;

        const uint8_t* p = buffer_.data() + cursor_;
        if (std::memcmp(p, kStreamMagic, sizeof(kStreamMagic)) != 0) {
            if (!resyncing_) {
                resyncing_ = true;
                ++errors_;
                if (on_error) on_error(ParseError::BAD_MAGIC, stream_offset_);
            }
            auto from = buffer_.begin() + static_cast<std::ptrdiff_t>(cursor_ + 1);
            auto hit = std::search(from, buffer_.end(),
                                   std::begin(kStreamMagic), std::end(kStreamMagic));
            if (hit == buffer_.end()) {
                // Keep a tail that could be the start of a magic split across reads.
                discard(avail - (sizeof(kStreamMagic) - 1));
                break;
            }
            discard(static_cast<size_t>(hit - buffer_.begin()) - cursor_);
            continue;
        }

        if (avail < kStreamHeaderSize)
            break;

        const uint32_t payload_len = load32be(p + 12);
        if (payload_len > max_payload_) {
            if (!resyncing_) {
                resyncing_ = true;
                ++errors_;
                if (on_error) on_error(ParseError::LENGTH_TOO_LARGE, stream_offset_);
            }
            discard(1);
            continue;
        }

        if (avail < kStreamHeaderSize + payload_len)
            break;

        const uint64_t seq = load64be(p + 4);
        resyncing_ = false;
        ++frames_;
        ++emitted;
        if (on_frame) on_frame(seq, p + kStreamHeaderSize, payload_len);

        cursor_ += kStreamHeaderSize + payload_len;
        stream_offset_ += kStreamHeaderSize + payload_len;
    }

    compact();
    return emitted;
}

void StreamReassembler::discard(size_t n) {
    cursor_ += n;
    stream_offset_ += n;
    discarded_ += n;
}

void StreamReassembler::compact() {
    if (cursor_ == buffer_.size()) {
        buffer_.clear();
        cursor_ = 0;
    } else if (cursor_ >= 64 * 1024 && cursor_ * 2 >= buffer_.size()) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(cursor_));
        cursor_ = 0;
    }
}

}  // namespace wire
}  // namespace flowbench
