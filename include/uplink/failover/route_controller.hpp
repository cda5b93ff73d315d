#pragma once
/**
 * @file route_controller.hpp
 * @brief Installs/removes the failover default route and kicks the tunnel service.
 *
 * Both switches are idempotent: they act only when FailoverState says the
 * route is in the other position, and they update that flag only when the
 * kernel accepted the change. A failed attempt is therefore retried on the
 * next eligible cycle.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "uplink/failover/failover_state.hpp"
#include "uplink/failover/uplink.hpp"
#include "uplink/net/route_table.hpp"
#include "uplink/obs/log.hpp"
#include "uplink/os/service_control.hpp"

namespace uplink::failover {

enum class SwitchOutcome : std::uint8_t {
    NoOp,       ///< Already in the requested position
    Switched,   ///< Route change accepted
    RouteError  ///< Route change rejected; state unchanged
};

enum class RestartOutcome : std::uint8_t {
    NotAttempted,
    Restarted,
    Failed
};

std::string_view to_string(SwitchOutcome o) noexcept;

/** @struct SwitchResult
 *  @brief What one switch call did.
 */
struct SwitchResult {
    SwitchOutcome  route{SwitchOutcome::NoOp};
    RestartOutcome restart{RestartOutcome::NotAttempted};

    bool operator==(const SwitchResult&) const = default;
};

/** @struct ControllerConfig
 *  @brief Which route the controller owns and what to restart on failback.
 */
struct ControllerConfig {
    Uplink        secondary;       ///< Interface carrying the failover route
    std::uint32_t metric{0};       ///< Metric reserved for the failover route
    std::string   tunnel_service;  ///< Restarted on failback; empty disables
};

class RouteController {
public:
    RouteController(net::RouteTable& routes, os::ServiceControl& services,
                    obs::Logger& log, ControllerConfig cfg)
        : routes_(routes), services_(services), log_(log), cfg_(std::move(cfg)) {}

    /// Install `default via gateway` on the secondary unless already on it.
    SwitchResult switch_to_secondary(FailoverState& st, const net::Ipv4Address& gateway);

    /**
     * @brief Remove the failover route unless not on it.
     * @details The tunnel service is restarted whenever a removal was
     *          attempted, whether or not the kernel accepted it.
     */
    SwitchResult switch_to_primary(FailoverState& st);

private:
    RestartOutcome restart_tunnel();

    net::RouteTable&    routes_;
    os::ServiceControl& services_;
    obs::Logger&        log_;
    ControllerConfig    cfg_;
};

} // namespace uplink::failover
