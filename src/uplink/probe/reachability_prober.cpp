/**
 * @file reachability_prober.cpp
 * @brief Implementation of ReachabilityProber.
 */
#include "uplink/probe/reachability_prober.hpp"

#include <string>

namespace uplink::probe {

failover::ProbeResult ReachabilityProber::probe(const failover::Uplink& link, std::stop_token stop) const {
    failover::ProbeResult res{link.role, link.iface, 0, static_cast<std::uint32_t>(targets_.size())};

    for (const auto& target : targets_) {
        if (stop.stop_requested()) {
            ++res.unreachable;
            continue;
        }
        if (pinger_.reachable(link.iface, target, params_, stop)) {
            log_.debug(target.to_string() + " is reachable via " + link.iface);
            continue;
        }
        ++res.unreachable;
        if (!stop.stop_requested()) {
            log_.info("Cannot reach " + target.to_string() + " via " + link.iface);
        }
    }
    return res;
}

} // namespace uplink::probe
