// apps/probe_tool/src/main.cpp
// uplink-failover: probe_tool
// Purpose: one-shot reachability check through a single interface, using the
// same prober and ICMP primitive as the daemon. Handy when tuning targets or
// checking a freshly cabled uplink.
//
// Usage:
//   ./probe_tool <iface> [target_ip...]
//
// Prints "<iface>: <unreachable>/<targets> unreachable" and exits 0 when every
// target answered, 1 when at least one did not, 2 on usage errors.

#include <iostream>
#include <stop_token>
#include <string>
#include <vector>

#include "uplink/config/config_loader.hpp"
#include "uplink/failover/uplink.hpp"
#include "uplink/net/ipv4.hpp"
#include "uplink/obs/log.hpp"
#include "uplink/probe/icmp_pinger.hpp"
#include "uplink/probe/reachability_prober.hpp"

int main(int argc, char** argv) {
    using namespace uplink;

    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <iface> [target_ip...]" << std::endl;
        return 2;
    }

    std::vector<net::Ipv4Address> targets;
    for (int i = 2; i < argc; ++i) {
        auto a = net::parse_ipv4(argv[i]);
        if (!a) {
            std::cerr << "Invalid IPv4 address: " << argv[i] << std::endl;
            return 2;
        }
        targets.push_back(*a);
    }
    if (targets.empty()) targets = config::Loader::defaults().targets;

    obs::Logger& log = *obs::make_stdout_logger();
    log.set_threshold(obs::Severity::Debug);

    probe::IcmpPinger pinger;
    const probe::ReachabilityProber prober(pinger, std::move(targets), probe::PingParams{}, log);

    const failover::Uplink link{argv[1], failover::Role::Primary};
    const auto res = prober.probe(link, std::stop_token{});

    std::cout << res.iface << ": " << res.unreachable << "/" << res.targets << " unreachable" << std::endl;
    return res.unreachable == 0 ? 0 : 1;
}
