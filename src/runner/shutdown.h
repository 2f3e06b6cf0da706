#pragma once

#include <atomic>

namespace flowbench {

/// SIGINT/SIGTERM raise the shutdown flag; flows finish the unit in hand,
/// flush their logs and exit with 130. A second signal while shutting down
/// exits immediately (a stream write may be blocked on a stalled peer).
void installShutdownHandler();

const std::atomic<bool>& shutdownFlag();

inline bool shutdownRequested() {
    return shutdownFlag().load(std::memory_order_relaxed);
}

}  // namespace flowbench
