#include "pacing/rate_pacer.h"
#include "core/errors.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace flowbench {

RatePacer::RatePacer(IClock& clock, double target_bitrate_bps)
    : clock_(clock), bitrate_bps_(target_bitrate_bps)
{
    if (!std::isfinite(target_bitrate_bps) || target_bitrate_bps <= 0.0)
        throw ConfigError("RatePacer: target bitrate must be > 0");
}

void RatePacer::start(uint64_t t0_ns) {
    t0_ns_ = t0_ns;
    cumulative_bits_ = 0;
    last_deadline_ = 0;
    scheduled_ = 0;
    started_ = true;
}

uint64_t RatePacer::intervalNs(uint32_t bytes) const {
    const long double ns = static_cast<long double>(bytes) * 8.0L * 1e9L /
                           static_cast<long double>(bitrate_bps_);
    return static_cast<uint64_t>(std::llround(ns));
}

uint64_t RatePacer::nextDeadline(uint32_t bytes) {
    if (!started_)
        throw std::logic_error("RatePacer: nextDeadline before start");

    const long double offset = static_cast<long double>(cumulative_bits_) * 1e9L /
                               static_cast<long double>(bitrate_bps_);
    uint64_t deadline = t0_ns_ + static_cast<uint64_t>(std::llround(offset));

    if (scheduled_ > 0 && deadline <= last_deadline_)
        deadline = last_deadline_ + 1;

    cumulative_bits_ += static_cast<uint64_t>(bytes) * 8u;
    last_deadline_ = deadline;
    ++scheduled_;
    return deadline;
}

PacedSlot RatePacer::waitForSlot(uint32_t bytes, const std::atomic<bool>* stop) {
    PacedSlot slot;
    slot.scheduled_ns = nextDeadline(bytes);

    while (true) {
        if (stop && stop->load(std::memory_order_relaxed)) {
            slot.stopped = true;
            break;
        }
        const uint64_t now = clock_.nowNs();
        if (now >= slot.scheduled_ns)
            break;
        clock_.sleepUntilNs(std::min(slot.scheduled_ns, now + kSleepSliceNs));
    }
    return slot;
}

}  // namespace flowbench
