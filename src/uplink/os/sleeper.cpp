#include "uplink/os/sleeper.hpp"

#include <condition_variable>
#include <mutex>

namespace uplink::os {

void StopTokenSleeper::sleep_for(std::chrono::seconds d, std::stop_token stop) {
    std::mutex mu;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lk(mu);
    // Nothing notifies cv besides the stop token; the predicate only guards spurious wakeups.
    (void)cv.wait_for(lk, stop, d, [] { return false; });
}

} // namespace uplink::os
