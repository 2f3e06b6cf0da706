#include "clock/system_clock.h"

#include <chrono>
#include <thread>

namespace flowbench {

uint64_t SystemClock::nowNs() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

void SystemClock::sleepUntilNs(uint64_t deadline_ns) {
    const uint64_t now = nowNs();
    if (deadline_ns <= now)
        return;
    const auto wake = std::chrono::steady_clock::now() +
                      std::chrono::nanoseconds(deadline_ns - now);
    std::this_thread::sleep_until(wake);
}

}  // namespace flowbench
