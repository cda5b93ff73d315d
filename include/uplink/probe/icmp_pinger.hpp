#pragma once
/**
 * @file icmp_pinger.hpp
 * @brief ICMP echo Pinger bound to an interface with SO_BINDTODEVICE.
 * @details Prefers an unprivileged ICMP datagram socket and falls back to a
 *          raw socket where ping_group_range forbids it. Each attempt waits
 *          in short slices so a stop request is honoured promptly.
 */

#include "uplink/probe/pinger.hpp"

namespace uplink::probe {

class IcmpPinger final : public Pinger {
public:
    bool reachable(std::string_view iface,
                   const net::Ipv4Address& target,
                   const PingParams& params,
                   std::stop_token stop) override;
};

} // namespace uplink::probe
