#pragma once

#include <cstdint>

namespace flowbench {

/// Time source for pacing and event timestamps.
/// nowNs() is nanoseconds since the Unix epoch, so send and receive logs
/// written by different processes share one time base (clock sync between
/// hosts is a precondition, not something this interface provides).
class IClock {
public:
    virtual ~IClock() = default;
    virtual uint64_t nowNs() = 0;
    /// Block until nowNs() >= deadline_ns. Returns immediately if already past.
    virtual void sleepUntilNs(uint64_t deadline_ns) = 0;
};

}  // namespace flowbench
