#pragma once

#include "clock/iclock.h"

namespace flowbench {

/// Wall clock (CLOCK_REALTIME) for timestamps; sleeps are measured on the
/// steady clock so an NTP step during a sleep cannot stretch it unboundedly.
class SystemClock : public IClock {
public:
    uint64_t nowNs() override;
    void sleepUntilNs(uint64_t deadline_ns) override;
};

}  // namespace flowbench
