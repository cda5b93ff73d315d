/**
 * @file test_orchestrator.cpp
 * @brief End-to-end cycle tests for Orchestrator over in-memory doubles.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <stop_token>
#include <string>

#include "fakes.hpp"
#include "uplink/config/config_loader.hpp"
#include "uplink/failover/orchestrator.hpp"

using namespace std::chrono_literals;
using uplink::failover::Action;
using uplink::failover::ControllerConfig;
using uplink::failover::CycleReport;
using uplink::failover::FailoverState;
using uplink::failover::Orchestrator;
using uplink::failover::OrchestratorConfig;
using uplink::failover::OrchestratorDeps;
using uplink::failover::ProbeResult;
using uplink::failover::Reason;
using uplink::failover::Role;
using uplink::failover::RouteController;
using uplink::failover::RouteState;
using uplink::failover::SwitchOutcome;
using uplink::failover::Uplink;
using uplink::obs::Severity;
using uplink::obs::SimpleObserver;
using uplink::probe::PingParams;
using uplink::probe::ReachabilityProber;
using namespace uplink::test;

namespace {

constexpr std::uint32_t kMetric = 5;

OrchestratorConfig make_config() {
  return OrchestratorConfig{{"eth0", Role::Primary}, {"eth1", Role::Secondary}, kMetric, 3, 1s, 15s};
}

class OrchestratorTest : public ::testing::Test {
protected:
  OrchestratorTest() {
    table.addressed = {{"eth0", true}, {"eth1", true}};
    table.routes = {{"eth0", "192.0.2.1", 10}, {"eth1", "198.51.100.1", 20}};
  }

  CycleReport cycle(std::uint32_t primary_unreachable, std::uint32_t secondary_unreachable) {
    pinger.set_unreachable("eth0", primary_unreachable);
    pinger.set_unreachable("eth1", secondary_unreachable);
    return orch.run_cycle(st, std::stop_token{});
  }

  /// Drive the primary down until the failover route is installed.
  void fail_over() {
    for (int i = 0; i < 3; ++i) cycle(3, 0);
    ASSERT_TRUE(table.has_route("eth1", kMetric));
    ASSERT_TRUE(st.using_secondary);
  }

  std::vector<uplink::net::Ipv4Address> targets = uplink::config::Loader::defaults().targets;
  MemoryLogger log;
  FakeRouteTable table;
  ScriptedPinger pinger{targets};
  ReachabilityProber prober{pinger, targets, PingParams{}, log};
  FakeServiceControl services;
  RouteController controller{table, services, log, ControllerConfig{{"eth1", Role::Secondary}, kMetric, "tailscale"}};
  MemoryStatusSink status;
  RecordingSleeper sleeper;
  SimpleObserver observer{nullptr};
  Orchestrator orch{make_config(), OrchestratorDeps{table, prober, controller, status, sleeper, log, observer}};
  FailoverState st = orch.initial_state();
};

} // namespace

// ---------- steady state ----------

/** @test Healthy primary: no route change, counts published, normal pacing. */
TEST_F(OrchestratorTest, HealthyPrimary_NoChange) {
  for (int i = 0; i < 10; ++i) {
    const auto rep = cycle(0, 0);
    EXPECT_EQ(rep.state, RouteState::PrimaryActive);
    EXPECT_EQ(rep.decision.action, Action::Keep);
    EXPECT_EQ(rep.sleep, 1s);
    ASSERT_TRUE(rep.gateway);
    EXPECT_EQ(*rep.gateway, "198.51.100.1");
  }
  EXPECT_EQ(table.mutations(), 0);
  EXPECT_EQ(status.slots[0], 0u);
  EXPECT_EQ(status.slots[1], 0u);
  EXPECT_EQ(observer.snapshot().cycles, 10u);
}

/** @test Single lost targets never accumulate. */
TEST_F(OrchestratorTest, OneUnreachable_NeverFailsOver) {
  for (int i = 0; i < 10; ++i) cycle(1, 0);
  EXPECT_EQ(st.tracker.failures(Role::Primary), 0u);
  EXPECT_EQ(table.add_calls, 0);
  EXPECT_EQ(status.slots[0], 1u);
}

// ---------- failover ----------

/** @test Three consecutive failed cycles on the primary install exactly one route. */
TEST_F(OrchestratorTest, PrimaryDown_FailsOverOnThirdCycle) {
  EXPECT_EQ(cycle(3, 0).decision.action, Action::Keep);
  EXPECT_EQ(cycle(3, 0).decision.action, Action::Keep);
  EXPECT_EQ(table.add_calls, 0);

  const auto rep = cycle(3, 0);
  EXPECT_EQ(rep.decision.action, Action::SwitchToSecondary);
  EXPECT_EQ(rep.switched.route, SwitchOutcome::Switched);
  EXPECT_EQ(table.add_calls, 1);
  ASSERT_TRUE(table.has_route("eth1", kMetric));
  EXPECT_TRUE(log.contains(Severity::Warn, "3/3 failures"));

  // Still down: stay on the secondary without touching the table.
  for (int i = 0; i < 3; ++i) {
    const auto next = cycle(3, 0);
    EXPECT_EQ(next.state, RouteState::SecondaryActive);
    EXPECT_EQ(next.decision.reason, Reason::PrimaryStillDown);
  }
  EXPECT_EQ(table.mutations(), 1);
  EXPECT_EQ(observer.snapshot().failovers, 1u);
}

/** @test A clean cycle between failures restarts the count. */
TEST_F(OrchestratorTest, InterleavedRecovery_Delays) {
  cycle(3, 0);
  cycle(2, 0);
  cycle(0, 0);
  cycle(3, 0);
  cycle(3, 0);
  EXPECT_EQ(table.add_calls, 0);
  cycle(2, 0);
  EXPECT_EQ(table.add_calls, 1);
}

/** @test Both uplinks at threshold: no route change, reported once per cycle. */
TEST_F(OrchestratorTest, BothDown_NoSwitch) {
  for (int i = 0; i < 4; ++i) cycle(3, 3);
  EXPECT_EQ(table.mutations(), 0);
  EXPECT_EQ(observer.snapshot().both_down, 2u);
  EXPECT_TRUE(log.contains(Severity::Warn, "secondary also appears down"));
}

/** @test A secondary that recovered during the primary's outage qualifies again. */
TEST_F(OrchestratorTest, SecondaryRecovered_FailsOver) {
  cycle(3, 3);
  cycle(3, 3);
  const auto rep = cycle(3, 0);
  EXPECT_EQ(st.tracker.failures(Role::Secondary), 0u);
  EXPECT_EQ(rep.decision.action, Action::SwitchToSecondary);
}

/** @test Secondary one below threshold is still healthy enough to switch to. */
TEST_F(OrchestratorTest, SecondaryBelowThreshold_StillFailsOver) {
  cycle(3, 0);
  cycle(3, 2);
  const auto rep = cycle(3, 2);
  EXPECT_EQ(st.tracker.failures(Role::Secondary), 2u);
  EXPECT_EQ(rep.decision.action, Action::SwitchToSecondary);
  EXPECT_EQ(table.add_calls, 1);
}

// ---------- failback ----------

/** @test First fully clean primary cycle removes the route and restarts the tunnel. */
TEST_F(OrchestratorTest, PrimaryRecovers_FailsBack) {
  fail_over();

  const auto rep = cycle(0, 0);
  EXPECT_EQ(rep.decision.action, Action::SwitchToPrimary);
  EXPECT_FALSE(table.has_route("eth1", kMetric));
  EXPECT_EQ(table.delete_calls, 1);
  ASSERT_EQ(services.restarts.size(), 1u);
  EXPECT_EQ(services.restarts[0], "tailscale");
  EXPECT_EQ(observer.snapshot().failbacks, 1u);

  EXPECT_EQ(cycle(0, 0).state, RouteState::PrimaryActive);
  EXPECT_EQ(table.delete_calls, 1);
}

/** @test Partial primary recovery (one lost target) does not fail back. */
TEST_F(OrchestratorTest, PartialRecovery_StaysOnSecondary) {
  fail_over();
  for (int i = 0; i < 4; ++i) cycle(1, 0);
  EXPECT_TRUE(table.has_route("eth1", kMetric));
  EXPECT_EQ(table.delete_calls, 0);
}

// ---------- standby ----------

/** @test No address on either uplink: no probing, slots cleared, standby pacing. */
TEST_F(OrchestratorTest, NoLink_Standby) {
  status.publish(Role::Primary, 2);
  table.addressed = {{"eth0", false}, {"eth1", false}};

  const auto rep = cycle(0, 0);
  EXPECT_EQ(rep.state, RouteState::NoLink);
  EXPECT_FALSE(rep.probed());
  EXPECT_EQ(rep.sleep, 15s);
  EXPECT_EQ(pinger.total_calls(), 0);
  EXPECT_EQ(status.clears, 1);
  EXPECT_FALSE(status.slots[0]);
  EXPECT_EQ(table.mutations(), 0);
}

TEST_F(OrchestratorTest, MissingInterfaces_Standby) {
  table.addressed.clear();
  EXPECT_EQ(cycle(0, 0).state, RouteState::NoLink);
  EXPECT_EQ(pinger.total_calls(), 0);
}

TEST_F(OrchestratorTest, OneLinkAddressed_Probes) {
  table.addressed["eth0"] = false;
  EXPECT_TRUE(cycle(0, 0).probed());
}

// ---------- route-state reconciliation ----------

/** @test A failover route left by an earlier run is recognized on the first cycle. */
TEST_F(OrchestratorTest, ExistingRoute_AdoptedOnStartup) {
  table.routes.push_back({"eth1", "198.51.100.1", kMetric});
  const auto rep = cycle(3, 0);
  EXPECT_EQ(rep.state, RouteState::SecondaryActive);
  EXPECT_TRUE(st.using_secondary);
  EXPECT_EQ(table.add_calls, 0);
}

/** @test A route removed by someone else clears the flag. */
TEST_F(OrchestratorTest, RouteRemovedExternally_FlagCleared) {
  fail_over();
  table.routes.erase(table.routes.end() - 1);
  const auto rep = cycle(0, 0);
  EXPECT_EQ(rep.state, RouteState::PrimaryActive);
  EXPECT_FALSE(st.using_secondary);
  EXPECT_EQ(rep.decision.action, Action::Keep);
  EXPECT_EQ(table.mutations(), 1);
  EXPECT_TRUE(services.restarts.empty());
}

/** @test Primary still down when the route disappears: it is reinstalled in the same cycle. */
TEST_F(OrchestratorTest, RouteRemovedExternally_ReinstalledWhilePrimaryDown) {
  fail_over();
  table.routes.erase(table.routes.end() - 1);
  const auto rep = cycle(3, 0);
  EXPECT_EQ(rep.state, RouteState::PrimaryActive);
  EXPECT_EQ(rep.decision.action, Action::SwitchToSecondary);
  EXPECT_TRUE(st.using_secondary);
  EXPECT_EQ(table.add_calls, 2);
}

/** @test Duplicate failover routes count as on-secondary and are removed one per failback. */
TEST_F(OrchestratorTest, DuplicateFailoverRoutes_RemovedOnePerCycle) {
  table.routes.push_back({"eth1", "198.51.100.1", kMetric});
  table.routes.push_back({"eth1", "198.51.100.1", kMetric});

  const auto first = cycle(3, 0);
  EXPECT_EQ(first.state, RouteState::SecondaryActive);
  EXPECT_TRUE(log.contains(Severity::Warn, "2 default routes with metric 5 on eth1"));
  EXPECT_EQ(table.add_calls, 0);

  const auto back = cycle(0, 0);
  EXPECT_EQ(back.decision.action, Action::SwitchToPrimary);
  EXPECT_EQ(table.delete_calls, 1);
  EXPECT_TRUE(table.has_route("eth1", kMetric));

  const auto again = cycle(0, 0);
  EXPECT_EQ(again.state, RouteState::SecondaryActive);
  EXPECT_EQ(again.decision.action, Action::SwitchToPrimary);
  EXPECT_EQ(table.delete_calls, 2);
  EXPECT_FALSE(table.has_route("eth1", kMetric));
  EXPECT_EQ(services.restarts.size(), 2u);

  EXPECT_EQ(cycle(0, 0).state, RouteState::PrimaryActive);
  EXPECT_EQ(table.delete_calls, 2);
}

/** @test Query failures keep the last known flag. */
TEST_F(OrchestratorTest, QueryFailure_KeepsFlagAndForcesFailback) {
  fail_over();
  table.fail_query = true;
  const auto rep = cycle(0, 0);
  EXPECT_EQ(rep.state, RouteState::SecondaryActive);
  EXPECT_TRUE(rep.forced_failback);
  EXPECT_TRUE(log.contains(Severity::Warn, "keeping last known route state"));
}

// ---------- gateway discovery ----------

/** @test Another actor's route wins over our own when both are present. */
TEST_F(OrchestratorTest, Gateway_PrefersOtherRoutes) {
  fail_over();
  table.routes.back().gateway = "203.0.113.9";
  const auto rep = cycle(3, 0);
  ASSERT_TRUE(rep.gateway);
  EXPECT_EQ(*rep.gateway, "198.51.100.1");
}

/** @test Once the managing actor withdraws its route, our own route keeps the secondary in use. */
TEST_F(OrchestratorTest, Gateway_FallsBackToOwnRoute) {
  fail_over();
  table.routes.erase(table.routes.begin() + 1);
  ASSERT_TRUE(table.has_route("eth1", kMetric));

  const auto rep = cycle(3, 0);
  EXPECT_FALSE(rep.forced_failback);
  ASSERT_TRUE(rep.gateway);
  EXPECT_EQ(*rep.gateway, "198.51.100.1");
  EXPECT_EQ(rep.decision.reason, Reason::PrimaryStillDown);
  EXPECT_TRUE(table.has_route("eth1", kMetric));
  EXPECT_EQ(table.delete_calls, 0);
  EXPECT_EQ(st.tracker.failures(Role::Primary), 3u);
}

TEST_F(OrchestratorTest, Gateway_LowestMetricWins) {
  table.routes.push_back({"eth1", "198.51.100.254", 15});
  const auto rep = cycle(0, 0);
  ASSERT_TRUE(rep.gateway);
  EXPECT_EQ(*rep.gateway, "198.51.100.254");
}

class OrchestratorGatewayTest : public OrchestratorTest,
                                public ::testing::WithParamInterface<std::string> {};

/** @test Malformed or empty gateway forces failback regardless of counters. */
TEST_P(OrchestratorGatewayTest, UnusableGateway_ForcesFailback) {
  table.routes.push_back({"eth1", "198.51.100.1", kMetric});
  cycle(3, 0);
  cycle(3, 0);
  ASSERT_EQ(st.tracker.failures(Role::Primary), 2u);
  const int probes_before = pinger.total_calls();

  table.set_gateway("eth1", kMetric, GetParam());
  const auto rep = cycle(3, 0);

  EXPECT_TRUE(rep.forced_failback);
  EXPECT_FALSE(rep.probed());
  EXPECT_EQ(rep.sleep, 15s);
  EXPECT_EQ(pinger.total_calls(), probes_before);
  EXPECT_FALSE(table.has_route("eth1", kMetric));
  EXPECT_FALSE(st.using_secondary);
  EXPECT_EQ(services.restarts.size(), 1u);
  EXPECT_EQ(st.tracker.failures(Role::Primary), 2u);
  EXPECT_EQ(observer.snapshot().forced_failbacks, 1u);
}

INSTANTIATE_TEST_SUITE_P(Malformed, OrchestratorGatewayTest,
                         ::testing::Values(std::string("abc"), std::string("999.999.1.1"),
                                           std::string(""), std::string("10.0.0")));

/** @test Forced failback while already on the primary changes nothing. */
TEST_F(OrchestratorTest, MissingGateway_OnPrimary_NoOp) {
  table.routes.erase(table.routes.end() - 1);
  const auto rep = cycle(0, 0);
  EXPECT_TRUE(rep.forced_failback);
  EXPECT_EQ(rep.switched.route, SwitchOutcome::NoOp);
  EXPECT_EQ(table.mutations(), 0);
  EXPECT_TRUE(services.restarts.empty());
}

// ---------- errors ----------

TEST_F(OrchestratorTest, RouteAddRejected_RetriedNextCycle) {
  table.fail_add = true;
  for (int i = 0; i < 3; ++i) cycle(3, 0);
  EXPECT_FALSE(st.using_secondary);
  EXPECT_EQ(observer.snapshot().route_errors, 1u);

  table.fail_add = false;
  cycle(3, 0);
  EXPECT_TRUE(table.has_route("eth1", kMetric));
  EXPECT_EQ(table.add_calls, 2);
}

namespace {

/// Returns a result outside [0, targets] for the primary.
class BrokenProber final : public uplink::probe::Prober {
public:
  ProbeResult probe(const Uplink& link, std::stop_token) const override {
    return {link.role, link.iface, link.role == Role::Primary ? 4u : 0u, 3};
  }
  std::size_t target_count() const noexcept override { return 3; }
};

} // namespace

/** @test An out-of-range probe result is a fatal contract violation. */
TEST_F(OrchestratorTest, InvalidProbeResult_Throws) {
  BrokenProber broken;
  Orchestrator bad{make_config(), OrchestratorDeps{table, broken, controller, status, sleeper, log, observer}};
  FailoverState s = bad.initial_state();
  EXPECT_THROW(bad.run_cycle(s, std::stop_token{}), std::logic_error);
  EXPECT_EQ(table.mutations(), 0);
}

// ---------- cancellation ----------

/** @test A stop request interrupts the cycle before any decision. */
TEST_F(OrchestratorTest, StopRequested_Interrupted) {
  std::stop_source src;
  src.request_stop();
  pinger.set_unreachable("eth0", 3);
  const auto rep = orch.run_cycle(st, src.get_token());
  EXPECT_TRUE(rep.interrupted);
  EXPECT_EQ(st.tracker.failures(Role::Primary), 0u);
  EXPECT_EQ(status.publishes, 0);
  EXPECT_EQ(table.mutations(), 0);
}

TEST_F(OrchestratorTest, Run_ReturnsWhenStopped) {
  std::stop_source src;
  src.request_stop();
  orch.run(src.get_token());
  EXPECT_TRUE(sleeper.sleeps.empty());
  EXPECT_TRUE(log.contains(Severity::Info, "Stop requested"));
}
