/**
 * @file ipv4.hpp
 * @brief Strict IPv4 dotted-quad value type.
 *
 * Gateways read from the routing table and probe targets from configuration
 * both pass through parse_ipv4() before use. Accepted form: exactly four
 * dot-separated fields of 1..3 decimal digits, each in [0, 255]. Anything
 * else (empty, letters, "999.999.1.1", CIDR suffixes, whitespace) is rejected.
 */
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace uplink::net {

struct Ipv4Address final {
  std::array<std::uint8_t, 4> octets{};

  /// Address in network byte order, ready for sockaddr_in / in_addr.
  [[nodiscard]] std::uint32_t to_network() const noexcept;

  /// Dotted-quad text without leading zeros.
  [[nodiscard]] std::string to_string() const;

  bool operator==(const Ipv4Address&) const = default;
};

/// Parse a dotted-quad; std::nullopt when malformed.
[[nodiscard]] std::optional<Ipv4Address> parse_ipv4(std::string_view text) noexcept;

/// Build from a network-byte-order value (as found in in_addr::s_addr).
[[nodiscard]] Ipv4Address from_network(std::uint32_t be) noexcept;

} // namespace uplink::net
