#include "runner/shutdown.h"
#include "core/errors.h"

#include <csignal>
#include <cstring>
#include <unistd.h>

namespace flowbench {

static std::atomic<bool> g_stop{false};

static void onSignal(int /*sig*/) {
    if (g_stop.exchange(true, std::memory_order_relaxed))
        _exit(kExitInterrupted);
}

void installShutdownHandler() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: blocking socket calls return EINTR and see the flag.
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
}

const std::atomic<bool>& shutdownFlag() {
    return g_stop;
}

}  // namespace flowbench
