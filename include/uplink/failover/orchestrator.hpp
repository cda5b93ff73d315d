#pragma once
/**
 * @file orchestrator.hpp
 * @brief Polling loop: reconcile, discover gateway, probe, debounce, decide, sleep.
 *
 * **Per cycle**
 * - No IPv4 address on either uplink: clear the monitoring slots, standby sleep.
 * - Re-derive "using secondary" from the live table (our metric on the secondary).
 * - Discover the secondary's gateway, preferring routes other than ours and
 *   falling back to our own. Missing or malformed: force failback, standby
 *   sleep. Counters are not consulted.
 * - Probe both uplinks concurrently, publish counts, feed the tracker, apply
 *   the policy through the RouteController, normal sleep.
 *
 * **Threading**
 * - run()/run_cycle() execute on one control thread, the only writer of
 *   FailoverState. Each cycle spawns exactly two probe tasks and joins both.
 * - A stop request aborts in-flight probes; the cycle then returns
 *   `interrupted` without deciding anything.
 */

#include <chrono>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>

#include "uplink/failover/failover_policy.hpp"
#include "uplink/failover/failover_state.hpp"
#include "uplink/failover/route_controller.hpp"
#include "uplink/failover/uplink.hpp"
#include "uplink/net/route_table.hpp"
#include "uplink/obs/log.hpp"
#include "uplink/obs/observability.hpp"
#include "uplink/obs/status_sink.hpp"
#include "uplink/os/sleeper.hpp"
#include "uplink/probe/reachability_prober.hpp"

namespace uplink::failover {

/** @struct OrchestratorConfig
 *  @brief Uplinks, owned metric and loop pacing.
 */
struct OrchestratorConfig {
    Uplink               primary{"", Role::Primary};
    Uplink               secondary{"", Role::Secondary};
    std::uint32_t        failover_metric{config::constants::FAILOVER_ROUTE_METRIC};
    std::uint32_t        failure_threshold{config::constants::FAILURE_THRESHOLD};
    std::chrono::seconds check_interval{config::constants::CHECK_INTERVAL_S};
    std::chrono::seconds standby_interval{config::constants::STANDBY_INTERVAL_S};
};

/** @struct OrchestratorDeps
 *  @brief Collaborators; all outlive the orchestrator.
 */
struct OrchestratorDeps {
    net::RouteTable&                 routes;
    const probe::Prober&             prober;
    RouteController&                 controller;
    obs::StatusSink&                 status;
    os::Sleeper&                     sleeper;
    obs::Logger&                     log;
    obs::Observer&                   observer;
};

/** @struct CycleReport
 *  @brief Everything one cycle observed and did (for logging and tests).
 */
struct CycleReport {
    std::uint64_t              cycle{0};
    RouteState                 state{RouteState::NoLink};
    std::optional<std::string> gateway;          ///< Validated secondary gateway
    std::optional<ProbeResult> primary;          ///< Set when probing happened
    std::optional<ProbeResult> secondary;
    FailoverDecision           decision{};
    SwitchResult               switched{};
    bool                       forced_failback{false};
    bool                       interrupted{false};
    std::chrono::seconds       sleep{0};

    [[nodiscard]] bool probed() const noexcept { return primary.has_value(); }
};

class Orchestrator {
public:
    Orchestrator(OrchestratorConfig cfg, OrchestratorDeps deps);

    /// Fresh state: counters at zero, route flag unknown (re-derived on the first cycle).
    [[nodiscard]] FailoverState initial_state() const;

    /**
     * @brief Run one cycle without sleeping.
     * @throws std::logic_error If a probe result is outside [0, targets].
     */
    CycleReport run_cycle(FailoverState& st, std::stop_token stop);

    /// Loop until @p stop is requested.
    void run(std::stop_token stop);

private:
    bool any_link_addressed();
    void reconcile_route_state(FailoverState& st);
    std::optional<net::Ipv4Address> discover_gateway(std::string& raw);
    std::pair<ProbeResult, ProbeResult> probe_both(std::stop_token stop);
    void check_result(const ProbeResult& r) const;
    void log_counter(const CounterUpdate& up, const std::string& iface);
    void apply(FailoverState& st, const net::Ipv4Address& gateway, CycleReport& rep);
    void record(const FailoverState& st, obs::EventKind kind, const CycleReport& rep, std::string reason);
    void record_switch(const FailoverState& st, obs::EventKind on_success, const CycleReport& rep);

    OrchestratorConfig cfg_;
    OrchestratorDeps   deps_;
    FailoverPolicy     policy_;
};

} // namespace uplink::failover
