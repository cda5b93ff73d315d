#pragma once
/**
 * @file pinger.hpp
 * @brief Reachability primitive: "can @p target be reached through @p iface?"
 */

#include <chrono>
#include <cstdint>
#include <stop_token>
#include <string_view>

#include "uplink/config/constants.hpp"
#include "uplink/net/ipv4.hpp"

namespace uplink::probe {

/** @struct PingParams
 *  @brief Attempt budget for one target.
 */
struct PingParams {
    std::uint32_t             attempts{config::constants::PING_COUNT};
    std::chrono::milliseconds timeout{config::constants::PING_TIMEOUT_MS}; ///< Per attempt
};

/** @class Pinger
 *  @brief Probe primitive seam.
 *
 * Implementations must be safe to call from two threads at once: the
 * orchestrator probes both uplinks concurrently through the same instance.
 */
class Pinger {
public:
    virtual ~Pinger() = default;

    /**
     * @brief Probe one target through one interface.
     * @return true iff at least one attempt got a reply within its timeout.
     *         A stop request ends the probe early and yields false.
     */
    virtual bool reachable(std::string_view iface,
                           const net::Ipv4Address& target,
                           const PingParams& params,
                           std::stop_token stop) = 0;
};

} // namespace uplink::probe
