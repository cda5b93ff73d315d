/**
 * @file orchestrator.cpp
 * @brief Implementation of the failover polling loop.
 */
#include "uplink/failover/orchestrator.hpp"

#include <future>
#include <stdexcept>

namespace uplink::failover {

using obs::EventKind;

Orchestrator::Orchestrator(OrchestratorConfig cfg, OrchestratorDeps deps)
    : cfg_(std::move(cfg)),
      deps_(deps),
      policy_(PolicyConfig{cfg_.failure_threshold}) {}

FailoverState Orchestrator::initial_state() const {
    return FailoverState{false, HysteresisTracker{cfg_.failure_threshold}, 0};
}

CycleReport Orchestrator::run_cycle(FailoverState& st, std::stop_token stop) {
    CycleReport rep;
    rep.cycle = ++st.cycle;

    // 1) Standby: the router is down or is the HA backup.
    if (!any_link_addressed()) {
        deps_.log.debug("No IPv4 address on " + cfg_.primary.iface + " or " + cfg_.secondary.iface +
                        ", clearing status slots. Either the router is down or it is the HA backup.");
        deps_.status.clear();
        rep.state = RouteState::NoLink;
        rep.sleep = cfg_.standby_interval;
        return rep;
    }

    // 2) Route ownership and gateway, both read fresh.
    reconcile_route_state(st);
    rep.state = st.using_secondary ? RouteState::SecondaryActive : RouteState::PrimaryActive;

    std::string raw_gateway;
    const auto gateway = discover_gateway(raw_gateway);
    if (!gateway) {
        deps_.log.info("Invalid or missing gateway for " + cfg_.secondary.iface + ": '" + raw_gateway + "'");
        rep.forced_failback = true;
        rep.switched = deps_.controller.switch_to_primary(st);
        record_switch(st, EventKind::ForcedFailback, rep);
        rep.sleep = cfg_.standby_interval;
        return rep;
    }
    rep.gateway = gateway->to_string();

    // 3) Probe both uplinks in parallel and join.
    auto [primary, secondary] = probe_both(stop);
    if (stop.stop_requested()) {
        rep.interrupted = true;
        return rep;
    }
    check_result(primary);
    check_result(secondary);

    deps_.status.publish(Role::Primary, primary.unreachable);
    deps_.status.publish(Role::Secondary, secondary.unreachable);

    log_counter(st.tracker.record(Role::Primary, primary.unreachable), primary.iface);
    log_counter(st.tracker.record(Role::Secondary, secondary.unreachable), secondary.iface);
    rep.primary = std::move(primary);
    rep.secondary = std::move(secondary);

    apply(st, *gateway, rep);
    record(st, EventKind::Cycle, rep, std::string(to_string(rep.decision.reason)));

    rep.sleep = cfg_.check_interval;
    return rep;
}

void Orchestrator::run(std::stop_token stop) {
    FailoverState st = initial_state();
    deps_.log.debug("Starting uplink failover loop (" + cfg_.primary.iface + " primary, " +
                    cfg_.secondary.iface + " secondary, metric " + std::to_string(cfg_.failover_metric) + ")");

    while (!stop.stop_requested()) {
        const CycleReport rep = run_cycle(st, stop);
        if (rep.interrupted) break;
        deps_.sleeper.sleep_for(rep.sleep, stop);
    }
    deps_.log.info("Stop requested, leaving failover loop after cycle " + std::to_string(st.cycle));
}

bool Orchestrator::any_link_addressed() {
    for (const Uplink* link : {&cfg_.primary, &cfg_.secondary}) {
        const auto res = deps_.routes.has_ipv4_address(link->iface);
        if (!res) {
            // An absent interface simply has no address.
            const auto sev = res.error() == net::NetError::UnknownInterface ? obs::Severity::Debug
                                                                           : obs::Severity::Warn;
            deps_.log.log(sev, "Cannot query addresses of " + link->iface + ": " +
                               std::string(net::to_string(res.error())));
            continue;
        }
        if (*res) return true;
    }
    return false;
}

void Orchestrator::reconcile_route_state(FailoverState& st) {
    const auto owned = deps_.routes.default_routes(cfg_.secondary.iface, cfg_.failover_metric);
    if (!owned) {
        deps_.log.warn("Cannot read default routes of " + cfg_.secondary.iface + ": " +
                       std::string(net::to_string(owned.error())) + "; keeping last known route state");
        return;
    }

    const bool was = st.using_secondary;
    st.using_secondary = !owned->empty();
    if (owned->size() > 1) {
        deps_.log.warn(std::to_string(owned->size()) + " default routes with metric " +
                       std::to_string(cfg_.failover_metric) + " on " + cfg_.secondary.iface);
    }

    if (st.using_secondary) {
        deps_.log.log(was ? obs::Severity::Debug : obs::Severity::Info, "Currently using secondary route");
    } else {
        deps_.log.debug("Currently using default routes not set by this controller");
    }
}

std::optional<net::Ipv4Address> Orchestrator::discover_gateway(std::string& raw) {
    const auto routes = deps_.routes.default_routes(cfg_.secondary.iface, std::nullopt);
    if (!routes) {
        deps_.log.warn("Cannot read default routes of " + cfg_.secondary.iface + ": " +
                       std::string(net::to_string(routes.error())));
        return std::nullopt;
    }

    // Prefer the route of whichever actor manages the secondary (DHCP, ifup,
    // keepalived); our own route only echoes the gateway we installed and is
    // the fallback once that actor has withdrawn its route.
    const net::DefaultRoute* best = nullptr;
    const net::DefaultRoute* own = nullptr;
    std::size_t candidates = 0;
    for (const auto& r : *routes) {
        if (r.metric == cfg_.failover_metric) {
            if (own == nullptr) own = &r;
            continue;
        }
        ++candidates;
        if (best == nullptr || r.metric < best->metric) best = &r;
    }
    if (best == nullptr) {
        if (own == nullptr) return std::nullopt;
        deps_.log.debug("No other default route on " + cfg_.secondary.iface +
                        ", keeping the gateway of the failover route");
        best = own;
    }
    if (candidates > 1) {
        deps_.log.debug(std::to_string(candidates) + " default routes on " + cfg_.secondary.iface +
                        ", using metric " + std::to_string(best->metric));
    }

    raw = best->gateway;
    return net::parse_ipv4(raw);
}

std::pair<ProbeResult, ProbeResult> Orchestrator::probe_both(std::stop_token stop) {
    const auto& prober = deps_.prober;
    auto p = std::async(std::launch::async, [&prober, link = cfg_.primary, stop] { return prober.probe(link, stop); });
    auto s = std::async(std::launch::async, [&prober, link = cfg_.secondary, stop] { return prober.probe(link, stop); });
    // get() order only matters for exceptions; both tasks run to completion either way.
    ProbeResult primary = p.get();
    ProbeResult secondary = s.get();
    return {std::move(primary), std::move(secondary)};
}

void Orchestrator::check_result(const ProbeResult& r) const {
    const auto targets = static_cast<std::uint32_t>(deps_.prober.target_count());
    if (r.targets != targets || r.unreachable > r.targets) {
        throw std::logic_error("Invalid probe result for " + r.iface + ": " +
                               std::to_string(r.unreachable) + "/" + std::to_string(r.targets) +
                               " unreachable, expected at most " + std::to_string(targets));
    }
}

void Orchestrator::log_counter(const CounterUpdate& up, const std::string& iface) {
    const std::string who = std::string(to_string(up.role)) + " (" + iface + ")";
    switch (up.change) {
        case CounterChange::Incremented:
        case CounterChange::Saturated:
            deps_.log.warn(who + " connectivity check failed (" + std::to_string(up.current) + "/" +
                           std::to_string(cfg_.failure_threshold) + " failures)");
            break;
        case CounterChange::Reset:
            deps_.log.info(who + " connectivity restored, resetting failure counter");
            break;
        case CounterChange::Noise:
            deps_.log.debug(who + " lost a single target, not counted");
            break;
        case CounterChange::Unchanged:
            break;
    }
}

void Orchestrator::apply(FailoverState& st, const net::Ipv4Address& gateway, CycleReport& rep) {
    rep.decision = policy_.evaluate(rep.state,
                                    st.tracker.failures(Role::Primary),
                                    st.tracker.failures(Role::Secondary));

    switch (rep.decision.action) {
        case Action::SwitchToSecondary:
            deps_.log.info("Primary failure threshold reached, secondary appears healthy");
            rep.switched = deps_.controller.switch_to_secondary(st, gateway);
            record_switch(st, EventKind::Failover, rep);
            break;
        case Action::SwitchToPrimary:
            deps_.log.info("Primary appears healthy, switching back from secondary");
            rep.switched = deps_.controller.switch_to_primary(st);
            record_switch(st, EventKind::Failback, rep);
            break;
        case Action::Keep:
            if (rep.decision.reason == Reason::BothDown) {
                deps_.log.warn("Primary failure threshold reached, but secondary also appears down");
                record(st, EventKind::BothDown, rep, "both_down");
            } else if (rep.decision.reason == Reason::PrimaryStillDown) {
                deps_.log.info("Primary still down, keeping secondary active");
            }
            break;
    }
}

void Orchestrator::record(const FailoverState& st, EventKind kind, const CycleReport& rep, std::string reason) {
    obs::DecisionEvent e;
    e.cycle = rep.cycle;
    e.kind = kind;
    e.state = rep.state;
    e.primary_failures = st.tracker.failures(Role::Primary);
    e.secondary_failures = st.tracker.failures(Role::Secondary);
    e.gateway = rep.gateway.value_or("");
    e.reason = std::move(reason);
    deps_.observer.record(e);
}

void Orchestrator::record_switch(const FailoverState& st, EventKind on_success, const CycleReport& rep) {
    const std::string reason = rep.forced_failback ? "gateway_unusable"
                                                   : std::string(to_string(rep.decision.reason));
    if (rep.switched.route == SwitchOutcome::Switched) record(st, on_success, rep, reason);
    if (rep.switched.route == SwitchOutcome::RouteError) record(st, EventKind::RouteError, rep, reason);
    if (rep.switched.restart == RestartOutcome::Failed) record(st, EventKind::RestartError, rep, reason);
}

} // namespace uplink::failover
