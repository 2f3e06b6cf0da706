#pragma once

#include "clock/iclock.h"
#include <atomic>
#include <cstdint>

namespace flowbench {

/// Deterministic clock for tests: time only moves when advanced or slept on.
/// sleepUntilNs jumps straight to the deadline.
class ManualClock : public IClock {
public:
    explicit ManualClock(uint64_t start_ns = 0) : now_(start_ns) {}

    uint64_t nowNs() override { return now_.load(std::memory_order_acquire); }
    void sleepUntilNs(uint64_t deadline_ns) override;

    void advance(uint64_t delta_ns) { now_.fetch_add(delta_ns, std::memory_order_acq_rel); }
    void set(uint64_t t_ns) { now_.store(t_ns, std::memory_order_release); }

private:
    std::atomic<uint64_t> now_;
};

}  // namespace flowbench
