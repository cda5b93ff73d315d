/**
 * @file uplink.hpp
 * @brief Common uplink model shared by the prober, tracker, controller and orchestrator.
 *
 * Centralizing these types keeps role naming and per-cycle results
 * consistent across modules.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace uplink::failover {

/**
 * @brief Role of a WAN link.
 *
 * @note Semantics:
 *  - Primary:   preferred egress; its routes are managed by other actors.
 *  - Secondary: backup egress; this controller owns one default route on it.
 */
enum class Role : std::uint8_t {
  Primary = 0,
  Secondary = 1
};

/// "primary" / "secondary".
constexpr std::string_view to_string(Role r) noexcept {
  return r == Role::Primary ? "primary" : "secondary";
}

/**
 * @brief One WAN link: OS interface name plus role.
 */
struct Uplink final {
  /// Interface name, e.g. "eth0".
  std::string iface;

  Role role{Role::Primary};

  bool operator==(const Uplink&) const = default;
};

/**
 * @brief Outcome of probing one uplink for one cycle.
 *
 * `unreachable` is in [0, targets]; the orchestrator rejects anything else.
 */
struct ProbeResult final {
  Role role{Role::Primary};
  std::string iface;
  std::uint32_t unreachable{0};
  std::uint32_t targets{0};

  bool operator==(const ProbeResult&) const = default;
};

/**
 * @brief Route ownership state derived each cycle from the live table.
 */
enum class RouteState : std::uint8_t {
  NoLink = 0,        ///< Neither uplink carries an IPv4 address
  PrimaryActive,     ///< Our failover route is absent
  SecondaryActive    ///< Our failover route is installed
};

constexpr std::string_view to_string(RouteState s) noexcept {
  switch (s) {
    case RouteState::NoLink:          return "NO_LINK";
    case RouteState::PrimaryActive:   return "PRIMARY_ACTIVE";
    case RouteState::SecondaryActive: return "SECONDARY_ACTIVE";
  }
  return "UNKNOWN";
}

} // namespace uplink::failover
