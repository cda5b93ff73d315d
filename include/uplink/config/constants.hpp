#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the failover controller.
 * @details These values eliminate magic numbers from the codebase. Override via
 *          command-line flags (see config_loader.hpp) in production deployments.
 */

#include <array>
#include <cstdint>
#include <string_view>

namespace uplink::config::constants {

// =====================
// Uplinks
// =====================
inline constexpr std::string_view PRIMARY_INTERFACE   = "eth0"; ///< WAN1
inline constexpr std::string_view SECONDARY_INTERFACE = "eth1"; ///< WAN2

/// Metric of the default route owned by this controller.
/// DHCP hooks, ifup and keepalived use 10 (WAN1) and 20 (WAN2); HA scripts use none.
inline constexpr uint32_t FAILOVER_ROUTE_METRIC = 5;

// =====================
// Reachability probing
// =====================
inline constexpr uint32_t PING_COUNT      = 3;    ///< Attempts per target
inline constexpr uint32_t PING_TIMEOUT_MS = 2000; ///< Per-attempt reply budget

/// Reference addresses probed through both uplinks (Cloudflare, Google, OpenDNS).
inline constexpr std::array<std::string_view, 3> PROBE_TARGETS = {
    "1.1.1.1", "8.8.8.8", "208.67.222.222"
};

// =====================
// Hysteresis
// =====================
inline constexpr uint32_t FAILURE_THRESHOLD = 3; ///< Consecutive failed cycles before "down"
/// A cycle is a failure only from this many unreachable targets on (one lost target is noise).
inline constexpr uint32_t FAILURE_MIN_UNREACHABLE = 2;

// =====================
// Loop pacing (seconds)
// =====================
inline constexpr uint32_t CHECK_INTERVAL_S   = 1;  ///< Normal cycle
inline constexpr uint32_t STANDBY_INTERVAL_S = 15; ///< No link / no usable gateway

// =====================
// External monitoring handoff
// =====================
inline constexpr std::string_view STATUS_DIR            = "/tmp";
inline constexpr std::string_view PRIMARY_STATUS_FILE   = "wan1_status";
inline constexpr std::string_view SECONDARY_STATUS_FILE = "wan2_status";

// =====================
// Dependent tunnel service
// =====================
inline constexpr std::string_view TUNNEL_SERVICE = "tailscale";
inline constexpr std::string_view INIT_SCRIPT_DIR = "/etc/init.d";

// =====================
// Logging
// =====================
inline constexpr std::string_view LOG_LEVEL = "INFO";

} // namespace uplink::config::constants
