/**
 * @file hysteresis_tracker.cpp
 * @brief Implementation of HysteresisTracker.
 */
#include "uplink/failover/hysteresis_tracker.hpp"

namespace uplink::failover {

using config::constants::FAILURE_MIN_UNREACHABLE;

std::string_view to_string(CounterChange c) noexcept {
    switch (c) {
        case CounterChange::Unchanged:   return "unchanged";
        case CounterChange::Noise:       return "noise";
        case CounterChange::Incremented: return "incremented";
        case CounterChange::Saturated:   return "saturated";
        case CounterChange::Reset:       return "reset";
    }
    return "unknown";
}

CounterUpdate HysteresisTracker::record(Role role, std::uint32_t unreachable) noexcept {
    auto& counter = counters_[index(role)];
    CounterUpdate up{role, counter, counter, CounterChange::Unchanged};

    if (unreachable >= FAILURE_MIN_UNREACHABLE) {
        if (counter < threshold_) {
            ++counter;
            up.change = CounterChange::Incremented;
        } else {
            up.change = CounterChange::Saturated;
        }
    } else if (unreachable == 0) {
        if (counter > 0) {
            counter = 0; // no decay: one clean cycle clears it
            up.change = CounterChange::Reset;
        }
    } else {
        up.change = CounterChange::Noise;
    }

    up.current = counter;
    return up;
}

} // namespace uplink::failover
