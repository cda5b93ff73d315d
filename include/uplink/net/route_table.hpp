#pragma once
/**
 * @file route_table.hpp
 * @brief Read/write access to IPv4 interface addresses and default routes.
 *
 * The controller is never the sole owner of the table: DHCP hooks, ifup
 * and keepalived install default routes at their own metrics. Queries are
 * therefore repeated every cycle and mutations target a single
 * (interface, metric) pair.
 *
 * Errors are returned as NetError codes; no exceptions cross this seam.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "uplink/compat/expected.hpp"
#include "uplink/net/ipv4.hpp"

namespace uplink::net {

/// Result codes for route-table operations.
enum class NetError : std::uint8_t {
    SocketFailed = 1,   ///< Could not open or connect the routing socket
    QueryFailed,        ///< Dumping addresses/routes failed
    UnknownInterface,   ///< Interface name does not resolve to an index
    Exists,             ///< Add rejected: route already present
    NotFound,           ///< Delete rejected: no such route
    Rejected,           ///< Kernel refused the mutation for another reason
    AllocationFailed    ///< Building the request failed
};

std::string_view to_string(NetError e) noexcept;

/**
 * @brief One IPv4 default route as found in the main table.
 *
 * `gateway` is textual so that callers validate it with parse_ipv4() rather
 * than trusting the source; it is empty for device-only routes.
 */
struct DefaultRoute final {
    std::string   iface;
    std::string   gateway;
    std::uint32_t metric{0};

    bool operator==(const DefaultRoute&) const = default;
};

/** @class RouteTable
 *  @brief Routing-table seam (netlink in production, in-memory in tests).
 */
class RouteTable {
public:
    virtual ~RouteTable() = default;

    /// True when @p iface holds at least one IPv4 address.
    virtual uplink_detail::expected<bool, NetError>
    has_ipv4_address(std::string_view iface) = 0;

    /**
     * @brief List IPv4 default routes leaving through @p iface.
     * @param metric When set, only routes with exactly this metric.
     * @return Zero or more routes, ordered by ascending metric.
     */
    virtual uplink_detail::expected<std::vector<DefaultRoute>, NetError>
    default_routes(std::string_view iface, std::optional<std::uint32_t> metric) = 0;

    /// Install `default via gateway dev iface metric N`. Duplicates fail with Exists.
    virtual uplink_detail::expected<void, NetError>
    add_default_route(std::string_view iface, const Ipv4Address& gateway, std::uint32_t metric) = 0;

    /// Remove `default dev iface metric N`.
    virtual uplink_detail::expected<void, NetError>
    delete_default_route(std::string_view iface, std::uint32_t metric) = 0;
};

} // namespace uplink::net
