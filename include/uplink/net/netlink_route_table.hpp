#pragma once
/**
 * @file netlink_route_table.hpp
 * @brief RouteTable backed by libnl-route-3 (NETLINK_ROUTE).
 * @note libnl types are forward-declared; the dependency stays out of this header.
 */

#include <memory>

#include "uplink/net/route_table.hpp"

struct nl_sock;

namespace uplink::net {

class NetlinkRouteTable final : public RouteTable {
public:
    /**
     * @brief Factory: allocate and connect a NETLINK_ROUTE socket.
     * @return Connected table or SocketFailed.
     */
    static uplink_detail::expected<std::unique_ptr<NetlinkRouteTable>, NetError> open();

    ~NetlinkRouteTable() override;

    NetlinkRouteTable(const NetlinkRouteTable&) = delete;
    NetlinkRouteTable& operator=(const NetlinkRouteTable&) = delete;

    uplink_detail::expected<bool, NetError>
    has_ipv4_address(std::string_view iface) override;

    uplink_detail::expected<std::vector<DefaultRoute>, NetError>
    default_routes(std::string_view iface, std::optional<std::uint32_t> metric) override;

    uplink_detail::expected<void, NetError>
    add_default_route(std::string_view iface, const Ipv4Address& gateway, std::uint32_t metric) override;

    uplink_detail::expected<void, NetError>
    delete_default_route(std::string_view iface, std::uint32_t metric) override;

private:
    explicit NetlinkRouteTable(nl_sock* sk) noexcept : sk_(sk) {}

    nl_sock* sk_{nullptr}; ///< Owned; freed in destructor
};

} // namespace uplink::net
