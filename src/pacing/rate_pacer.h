#pragma once

#include "clock/iclock.h"
#include "core/event_types.h"

#include <atomic>
#include <cstdint>

namespace flowbench {

/// How the pacer's schedule interacts with the transport.
///  UNBLOCKABLE        - datagrams: emit at the instant regardless of network
///                       state; a failed send drops the chunk.
///  BACKPRESSURE_AWARE - stream: the send after the instant may block on flow
///                       control; actual time trailing scheduled time is the
///                       measured signal, never retried or smoothed over.
enum class PacingPolicy : uint8_t {
    UNBLOCKABLE = 0,
    BACKPRESSURE_AWARE = 1
};

inline PacingPolicy policyFor(TransportMode mode) {
    return mode == TransportMode::DATAGRAM ? PacingPolicy::UNBLOCKABLE
                                           : PacingPolicy::BACKPRESSURE_AWARE;
}

inline const char* policyName(PacingPolicy p) {
    return p == PacingPolicy::UNBLOCKABLE ? "unblockable" : "backpressure-aware";
}

struct PacedSlot {
    uint64_t scheduled_ns = 0;
    bool     stopped = false;   // stop flag raised while waiting
};

/// Open-loop rate pacer.
///
/// Chunk i is scheduled at start + bits(chunks 0..i-1) / bitrate, computed
/// from the absolute start time and the cumulative bit count, so jitter in
/// any one send never shifts later deadlines. Deadlines are strictly
/// increasing. The pacer never looks at network feedback.
class RatePacer {
public:
    /// Throws ConfigError unless target_bitrate_bps is finite and > 0.
    RatePacer(IClock& clock, double target_bitrate_bps);

    /// Fix the schedule origin. Must be called before nextDeadline().
    void start(uint64_t t0_ns);

    /// Deadline for a chunk of the given size; advances the schedule.
    uint64_t nextDeadline(uint32_t bytes);

    /// nextDeadline() followed by a sleep until it. The sleep is sliced so a
    /// raised stop flag ends it early (slot.stopped is then true).
    PacedSlot waitForSlot(uint32_t bytes, const std::atomic<bool>* stop = nullptr);

    /// chunk_bits / bitrate, in nanoseconds.
    uint64_t intervalNs(uint32_t bytes) const;

    double   bitrate() const { return bitrate_bps_; }
    uint64_t startNs() const { return t0_ns_; }
    uint64_t scheduledChunks() const { return scheduled_; }
    uint64_t cumulativeBits() const { return cumulative_bits_; }

private:
    static constexpr uint64_t kSleepSliceNs = 50'000'000;  // 50 ms

    IClock&  clock_;
    double   bitrate_bps_;
    uint64_t t0_ns_ = 0;
    uint64_t cumulative_bits_ = 0;
    uint64_t last_deadline_ = 0;
    uint64_t scheduled_ = 0;
    bool     started_ = false;
};

}  // namespace flowbench
