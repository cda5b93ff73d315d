#if defined(__linux__)

#include "uplink/os/signals.hpp"

#include <cerrno>
#include <csignal>
#include <ctime>
#include <pthread.h>

namespace uplink::os {

static sigset_t termination_set() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

bool block_termination_signals() {
    const sigset_t set = termination_set();
    return pthread_sigmask(SIG_BLOCK, &set, nullptr) == 0;
}

SignalWatcher::SignalWatcher(std::stop_source source)
    : th_([this, source](std::stop_token self) { run(self, source); }) {}

void SignalWatcher::run(std::stop_token self, std::stop_source target) {
    const sigset_t set = termination_set();
    // Short timeout so the destructor's stop request is seen promptly.
    const timespec slice{0, 200'000'000};

    while (!self.stop_requested()) {
        const int sig = sigtimedwait(&set, nullptr, &slice);
        if (sig < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            break;
        }
        received_.store(sig, std::memory_order_release);
        target.request_stop();
        return;
    }
}

} // namespace uplink::os
#endif
