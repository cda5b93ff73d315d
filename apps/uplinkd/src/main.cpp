/**
 * @file main.cpp
 * @brief uplinkd: dual-WAN health monitor and default-route failover daemon.
 *
 * **Bootstrap**
 * - Parse flags over named defaults; an invalid log level or value is fatal.
 * - Block SIGINT/SIGTERM before any thread starts, then hand them to a watcher
 *   thread that requests stop on the shared stop_source.
 *
 * **Wiring**
 * - netlink RouteTable, ICMP Pinger, init-script ServiceControl, file status sink.
 *
 * **Lifecycle**
 * - Orchestrator::run() until a signal arrives (exit 0).
 * - A broken probe-result contract is fatal (exit 1).
 */

#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <stop_token>
#include <string>

#include "uplink/config/config_loader.hpp"
#include "uplink/failover/orchestrator.hpp"
#include "uplink/failover/route_controller.hpp"
#include "uplink/net/netlink_route_table.hpp"
#include "uplink/obs/log.hpp"
#include "uplink/obs/observability.hpp"
#include "uplink/obs/status_sink.hpp"
#include "uplink/os/service_control.hpp"
#include "uplink/os/signals.hpp"
#include "uplink/os/sleeper.hpp"
#include "uplink/probe/icmp_pinger.hpp"
#include "uplink/probe/reachability_prober.hpp"
#include "uplink/version.hpp"

using namespace uplink;

int main(int argc, char** argv) {
    obs::Logger& log = *obs::make_stdout_logger();

    auto settings = config::Loader::from_args(argc, argv);
    if (!settings) {
        const auto& issue = settings.error();
        if (issue.code == config::ConfigError::HelpRequested) {
            std::fputs(config::Loader::usage(argv[0]).c_str(), stdout);
            return 0;
        }
        log.error("Error: " + std::string(config::to_string(issue.code)) + ": " + issue.detail);
        std::fputs(config::Loader::usage(argv[0]).c_str(), stderr);
        return 1;
    }
    const config::FailoverSettings& cfg = *settings;
    log.set_threshold(cfg.log_level);

    if (!os::block_termination_signals()) {
        log.error("Error: cannot block SIGINT/SIGTERM");
        return 1;
    }
    std::stop_source stop;
    os::SignalWatcher watcher(stop);

    auto table = net::NetlinkRouteTable::open();
    if (!table) {
        log.error("Error: cannot open routing socket: " + std::string(net::to_string(table.error())));
        return 1;
    }
    net::RouteTable& routes = **table;

    const failover::Uplink primary{cfg.primary_iface, failover::Role::Primary};
    const failover::Uplink secondary{cfg.secondary_iface, failover::Role::Secondary};

    probe::IcmpPinger pinger;
    const probe::ReachabilityProber prober(pinger, cfg.targets, cfg.ping, log);

    os::InitScriptServiceControl services(cfg.init_dir);
    failover::RouteController controller(routes, services, log,
        failover::ControllerConfig{secondary, cfg.failover_metric, cfg.tunnel_service});

    const std::filesystem::path dir(cfg.status_dir);
    obs::FileStatusSink status((dir / cfg.primary_status_file).string(),
                               (dir / cfg.secondary_status_file).string(), log);
    os::StopTokenSleeper sleeper;

    failover::Orchestrator orchestrator(
        failover::OrchestratorConfig{primary, secondary, cfg.failover_metric, cfg.failure_threshold,
                                     cfg.check_interval, cfg.standby_interval},
        failover::OrchestratorDeps{routes, prober, controller, status, sleeper, log,
                                   *obs::make_simple_observer()});

    log.info(std::string("uplinkd ") + version_string + " starting");
    try {
        orchestrator.run(stop.get_token());
    } catch (const std::logic_error& e) {
        log.error(std::string("Error: ") + e.what());
        return 1;
    }

    if (const int sig = watcher.received(); sig != 0) {
        log.info("Terminated by signal " + std::to_string(sig));
    }
    return 0;
}
