#include "clock/manual_clock.h"

namespace flowbench {

void ManualClock::sleepUntilNs(uint64_t deadline_ns) {
    uint64_t cur = now_.load(std::memory_order_acquire);
    while (cur < deadline_ns &&
           !now_.compare_exchange_weak(cur, deadline_ns, std::memory_order_acq_rel)) {
    }
}

}  // namespace flowbench
