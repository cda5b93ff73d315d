/**
 * @file route_controller.cpp
 * @brief Implementation of RouteController.
 */
#include "uplink/failover/route_controller.hpp"

namespace uplink::failover {

std::string_view to_string(SwitchOutcome o) noexcept {
    switch (o) {
        case SwitchOutcome::NoOp:       return "noop";
        case SwitchOutcome::Switched:   return "switched";
        case SwitchOutcome::RouteError: return "route_error";
    }
    return "unknown";
}

SwitchResult RouteController::switch_to_secondary(FailoverState& st, const net::Ipv4Address& gateway) {
    if (st.using_secondary) return {};

    const std::string& dev = cfg_.secondary.iface;
    log_.info("Switching to secondary uplink (" + dev + ") via " + gateway.to_string());

    const auto res = routes_.add_default_route(dev, gateway, cfg_.metric);
    if (!res) {
        log_.warn("Failed to add default route via " + gateway.to_string() + " dev " + dev +
                  " metric " + std::to_string(cfg_.metric) + ": " + std::string(net::to_string(res.error())));
        return {SwitchOutcome::RouteError, RestartOutcome::NotAttempted};
    }

    st.using_secondary = true;
    log_.info("Successfully switched to secondary uplink (" + dev + ")");
    return {SwitchOutcome::Switched, RestartOutcome::NotAttempted};
}

SwitchResult RouteController::switch_to_primary(FailoverState& st) {
    if (!st.using_secondary) return {};

    const std::string& dev = cfg_.secondary.iface;
    log_.info("Switching back to primary uplink, removing route via " + dev);

    SwitchResult out;
    const auto res = routes_.delete_default_route(dev, cfg_.metric);
    if (res) {
        st.using_secondary = false;
        out.route = SwitchOutcome::Switched;
        log_.info("Successfully switched back to primary uplink");
    } else {
        out.route = SwitchOutcome::RouteError;
        log_.warn("Failed to remove default route dev " + dev + " metric " +
                  std::to_string(cfg_.metric) + ": " + std::string(net::to_string(res.error())));
    }

    // The tunnel keeps its old egress binding until restarted.
    out.restart = restart_tunnel();
    return out;
}

RestartOutcome RouteController::restart_tunnel() {
    if (cfg_.tunnel_service.empty()) return RestartOutcome::NotAttempted;

    const auto res = services_.restart(cfg_.tunnel_service);
    if (!res) {
        log_.error("Failed to restart " + cfg_.tunnel_service + " service: " +
                   std::string(os::to_string(res.error())));
        return RestartOutcome::Failed;
    }
    log_.info("Restarted " + cfg_.tunnel_service + " service to rebind through the primary uplink");
    return RestartOutcome::Restarted;
}

} // namespace uplink::failover
