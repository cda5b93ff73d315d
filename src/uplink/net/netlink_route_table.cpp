/**
 * @file netlink_route_table.cpp
 * @brief libnl-route-3 implementation of RouteTable.
 *
 * Every query dumps a fresh cache; nothing is kept between calls because
 * other actors mutate the table concurrently.
 */
#include "uplink/net/netlink_route_table.hpp"

#include <algorithm>
#include <cstring>
#include <string>

#include <arpa/inet.h>
#include <net/if.h>
#include <linux/rtnetlink.h>

#include <netlink/errno.h>
#include <netlink/netlink.h>
#include <netlink/socket.h>
#include <netlink/cache.h>
#include <netlink/addr.h>
#include <netlink/route/addr.h>
#include <netlink/route/route.h>
#include <netlink/route/nexthop.h>

namespace uplink::net {

namespace {

struct CacheFree { void operator()(nl_cache* c) const noexcept { nl_cache_free(c); } };
struct RoutePut  { void operator()(rtnl_route* r) const noexcept { rtnl_route_put(r); } };
struct AddrPut   { void operator()(nl_addr* a) const noexcept { nl_addr_put(a); } };

using CachePtr = std::unique_ptr<nl_cache, CacheFree>;
using RoutePtr = std::unique_ptr<rtnl_route, RoutePut>;
using AddrPtr  = std::unique_ptr<nl_addr, AddrPut>;

int ifindex_of(std::string_view iface) {
    if (iface.empty() || iface.size() >= IF_NAMESIZE) return 0;
    return static_cast<int>(if_nametoindex(std::string(iface).c_str()));
}

/// 0.0.0.0/0
AddrPtr default_dst() {
    const std::uint32_t any = 0;
    AddrPtr dst{nl_addr_build(AF_INET, &any, sizeof(any))};
    if (dst) nl_addr_set_prefixlen(dst.get(), 0);
    return dst;
}

bool is_default_dst(const nl_addr* dst) {
    return dst == nullptr || nl_addr_get_prefixlen(dst) == 0;
}

std::string gateway_text(const nl_addr* gw) {
    if (gw == nullptr || nl_addr_get_family(gw) != AF_INET ||
        nl_addr_get_len(gw) != sizeof(std::uint32_t)) {
        return {};
    }
    char buf[INET_ADDRSTRLEN] = {};
    if (inet_ntop(AF_INET, nl_addr_get_binary_addr(gw), buf, sizeof(buf)) == nullptr) return {};
    return buf;
}

/// Skeleton shared by add and delete: main table, IPv4, default dst, given metric.
RoutePtr make_default_route(int ifindex, std::uint32_t metric) {
    RoutePtr route{rtnl_route_alloc()};
    AddrPtr dst = default_dst();
    if (!route || !dst) return nullptr;

    rtnl_route_set_family(route.get(), AF_INET);
    rtnl_route_set_table(route.get(), RT_TABLE_MAIN);
    rtnl_route_set_priority(route.get(), metric);
    if (rtnl_route_set_dst(route.get(), dst.get()) < 0) return nullptr; // takes its own ref

    rtnl_nexthop* nh = rtnl_route_nh_alloc();
    if (nh == nullptr) return nullptr;
    rtnl_route_nh_set_ifindex(nh, ifindex);
    rtnl_route_add_nexthop(route.get(), nh); // route owns nh from here
    return route;
}

} // namespace

uplink_detail::expected<std::unique_ptr<NetlinkRouteTable>, NetError>
NetlinkRouteTable::open() {
    nl_sock* sk = nl_socket_alloc();
    if (sk == nullptr) return uplink_detail::unexpected(NetError::AllocationFailed);
    if (nl_connect(sk, NETLINK_ROUTE) < 0) {
        nl_socket_free(sk);
        return uplink_detail::unexpected(NetError::SocketFailed);
    }
    return std::unique_ptr<NetlinkRouteTable>(new NetlinkRouteTable(sk));
}

NetlinkRouteTable::~NetlinkRouteTable() {
    if (sk_ != nullptr) nl_socket_free(sk_); // also closes the fd
}

uplink_detail::expected<bool, NetError>
NetlinkRouteTable::has_ipv4_address(std::string_view iface) {
    const int idx = ifindex_of(iface);
    if (idx == 0) return uplink_detail::unexpected(NetError::UnknownInterface);

    nl_cache* raw = nullptr;
    if (rtnl_addr_alloc_cache(sk_, &raw) < 0) return uplink_detail::unexpected(NetError::QueryFailed);
    CachePtr cache{raw};

    for (nl_object* obj = nl_cache_get_first(cache.get()); obj != nullptr; obj = nl_cache_get_next(obj)) {
        auto* addr = reinterpret_cast<rtnl_addr*>(obj);
        if (rtnl_addr_get_ifindex(addr) == idx && rtnl_addr_get_family(addr) == AF_INET) return true;
    }
    return false;
}

uplink_detail::expected<std::vector<DefaultRoute>, NetError>
NetlinkRouteTable::default_routes(std::string_view iface, std::optional<std::uint32_t> metric) {
    const int idx = ifindex_of(iface);
    if (idx == 0) return uplink_detail::unexpected(NetError::UnknownInterface);

    nl_cache* raw = nullptr;
    if (rtnl_route_alloc_cache(sk_, AF_INET, 0, &raw) < 0) return uplink_detail::unexpected(NetError::QueryFailed);
    CachePtr cache{raw};

    std::vector<DefaultRoute> out;
    for (nl_object* obj = nl_cache_get_first(cache.get()); obj != nullptr; obj = nl_cache_get_next(obj)) {
        auto* route = reinterpret_cast<rtnl_route*>(obj);
        if (rtnl_route_get_table(route) != RT_TABLE_MAIN) continue;
        if (rtnl_route_get_type(route) != RTN_UNICAST) continue;
        if (!is_default_dst(rtnl_route_get_dst(route))) continue;

        const std::uint32_t prio = rtnl_route_get_priority(route);
        if (metric && *metric != prio) continue;

        // Multipath defaults list one entry per matching hop.
        const int hops = rtnl_route_get_nnexthops(route);
        for (int i = 0; i < hops; ++i) {
            rtnl_nexthop* nh = rtnl_route_nexthop_n(route, i);
            if (nh == nullptr || rtnl_route_nh_get_ifindex(nh) != idx) continue;
            out.push_back(DefaultRoute{std::string(iface), gateway_text(rtnl_route_nh_get_gateway(nh)), prio});
        }
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const DefaultRoute& a, const DefaultRoute& b) { return a.metric < b.metric; });
    return out;
}

uplink_detail::expected<void, NetError>
NetlinkRouteTable::add_default_route(std::string_view iface, const Ipv4Address& gateway, std::uint32_t metric) {
    const int idx = ifindex_of(iface);
    if (idx == 0) return uplink_detail::unexpected(NetError::UnknownInterface);

    RoutePtr route = make_default_route(idx, metric);
    const std::uint32_t gw_be = gateway.to_network();
    AddrPtr gw{nl_addr_build(AF_INET, &gw_be, sizeof(gw_be))};
    if (!route || !gw) return uplink_detail::unexpected(NetError::AllocationFailed);

    rtnl_route_set_scope(route.get(), RT_SCOPE_UNIVERSE);
    rtnl_route_set_protocol(route.get(), RTPROT_STATIC);
    rtnl_route_set_type(route.get(), RTN_UNICAST);
    rtnl_route_nh_set_gateway(rtnl_route_nexthop_n(route.get(), 0), gw.get());

    const int err = rtnl_route_add(sk_, route.get(), NLM_F_EXCL);
    if (err == -NLE_EXIST) return uplink_detail::unexpected(NetError::Exists);
    if (err < 0) return uplink_detail::unexpected(NetError::Rejected);
    return {};
}

uplink_detail::expected<void, NetError>
NetlinkRouteTable::delete_default_route(std::string_view iface, std::uint32_t metric) {
    const int idx = ifindex_of(iface);
    if (idx == 0) return uplink_detail::unexpected(NetError::UnknownInterface);

    RoutePtr route = make_default_route(idx, metric);
    if (!route) return uplink_detail::unexpected(NetError::AllocationFailed);
    rtnl_route_set_scope(route.get(), RT_SCOPE_NOWHERE); // match any scope, like `ip route del`

    const int err = rtnl_route_delete(sk_, route.get(), 0);
    if (err == -NLE_OBJ_NOTFOUND) return uplink_detail::unexpected(NetError::NotFound);
    if (err < 0) return uplink_detail::unexpected(NetError::Rejected);
    return {};
}

} // namespace uplink::net
