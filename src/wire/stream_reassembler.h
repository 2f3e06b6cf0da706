#pragma once

#include "wire/wire_format.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace flowbench {
namespace wire {

/// Recovers stream frames from an ordered byte stream delivered in
/// arbitrary pieces.
///
/// Bytes are buffered until a whole frame is present. A header with the
/// wrong magic, or a declared length above the frame limit, is a parse
/// error: the reassembler reports it once, discards bytes up to the next
/// frame magic and resumes there. It never emits a frame whose header did
/// not validate.
class StreamReassembler {
public:
    using FrameCallback = std::function<void(uint64_t seq, const uint8_t* payload, uint32_t len)>;
    using ErrorCallback = std::function<void(ParseError err, uint64_t stream_offset)>;

    explicit StreamReassembler(uint32_t max_payload = kMaxStreamFramePayload);

    /// Appends bytes and emits every frame completed by them.
    /// Returns the number of frames emitted.
    size_t feed(const uint8_t* data, size_t len,
                const FrameCallback& on_frame,
                const ErrorCallback& on_error);

    /// Bytes held for an incomplete trailing frame. Non-zero at stream
    /// close means the last unit was truncated.
    size_t pendingBytes() const { return buffer_.size() - cursor_; }

    uint64_t framesEmitted() const { return frames_; }
    uint64_t bytesDiscarded() const { return discarded_; }
    uint64_t parseErrors() const { return errors_; }

private:
    void discard(size_t n);
    void compact();

    uint32_t max_payload_;
    std::vector<uint8_t> buffer_;
    size_t   cursor_ = 0;
    uint64_t stream_offset_ = 0;   // stream position of buffer_[cursor_]
    bool     resyncing_ = false;
    uint64_t frames_ = 0;
    uint64_t discarded_ = 0;
    uint64_t errors_ = 0;
};

}  // namespace wire
}  // namespace flowbench
