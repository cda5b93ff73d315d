#pragma once
/**
 * @file reachability_prober.hpp
 * @brief Probe the fixed target set through one uplink and count failures.
 */

#include <cstddef>
#include <stop_token>
#include <utility>
#include <vector>

#include "uplink/failover/uplink.hpp"
#include "uplink/net/ipv4.hpp"
#include "uplink/obs/log.hpp"
#include "uplink/probe/pinger.hpp"

namespace uplink::probe {

/** @class Prober
 *  @brief Per-uplink probe seam consumed by the orchestrator.
 *
 * probe() is const and must keep no per-call state in the object, so the
 * two per-uplink probes of a cycle can run on separate threads.
 */
class Prober {
public:
    virtual ~Prober() = default;

    /**
     * @brief Probe every target through @p link.
     * @return Unreachable count in [0, target_count()]. Targets not reached
     *         before a stop request count as unreachable.
     */
    virtual failover::ProbeResult probe(const failover::Uplink& link, std::stop_token stop) const = 0;

    /// Size of the target set; the upper bound of every result.
    virtual std::size_t target_count() const noexcept = 0;
};

/** @class ReachabilityProber
 *  @brief Fan-in of Pinger results over a fixed target set.
 */
class ReachabilityProber final : public Prober {
public:
    ReachabilityProber(Pinger& pinger,
                       std::vector<net::Ipv4Address> targets,
                       PingParams params,
                       obs::Logger& log)
        : pinger_(pinger), targets_(std::move(targets)), params_(params), log_(log) {}

    failover::ProbeResult probe(const failover::Uplink& link, std::stop_token stop) const override;
    std::size_t target_count() const noexcept override { return targets_.size(); }

private:
    Pinger& pinger_;
    std::vector<net::Ipv4Address> targets_;
    PingParams params_;
    obs::Logger& log_;
};

} // namespace uplink::probe
