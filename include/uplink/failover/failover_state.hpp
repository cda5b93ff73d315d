#pragma once
/**
 * @file failover_state.hpp
 * @brief Across-cycle state, owned by the orchestrator's control thread.
 * @note Single writer; passed by reference into each cycle, no locking.
 */

#include <cstdint>

#include "uplink/failover/hysteresis_tracker.hpp"

namespace uplink::failover {

struct FailoverState {
    /// Our failover route is believed installed. Re-derived from the table every cycle.
    bool using_secondary{false};

    HysteresisTracker tracker;

    /// Number of cycles started.
    std::uint64_t cycle{0};
};

} // namespace uplink::failover
