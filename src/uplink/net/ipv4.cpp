/**
 * @file ipv4.cpp
 * @brief Dotted-quad parsing and formatting.
 */
#include "uplink/net/ipv4.hpp"

#include <cstring>
#include <arpa/inet.h>

namespace uplink::net {

std::optional<Ipv4Address> parse_ipv4(std::string_view text) noexcept {
    // inet_pton rejects leading zeros ("010"); drop them per field, keep the
    // three-digit cap, and let inet_pton check field count and range.
    char canon[INET_ADDRSTRLEN] = {};
    std::size_t len = 0;
    std::size_t pos = 0;

    for (;;) {
        std::size_t end = text.find('.', pos);
        if (end == std::string_view::npos) end = text.size();

        std::string_view field = text.substr(pos, end - pos);
        if (field.empty() || field.size() > 3) return std::nullopt;
        for (const char c : field) {
            if (c < '0' || c > '9') return std::nullopt;
        }
        while (field.size() > 1 && field.front() == '0') field.remove_prefix(1);

        if (len + field.size() + 1 > sizeof(canon)) return std::nullopt;
        std::memcpy(canon + len, field.data(), field.size());
        len += field.size();

        if (end == text.size()) break;
        canon[len++] = '.';
        pos = end + 1;
    }

    in_addr a{};
    if (inet_pton(AF_INET, canon, &a) != 1) return std::nullopt;
    return from_network(a.s_addr);
}

std::uint32_t Ipv4Address::to_network() const noexcept {
    std::uint32_t be = 0;
    std::memcpy(&be, octets.data(), sizeof(be));
    return be;
}

std::string Ipv4Address::to_string() const {
    char buf[INET_ADDRSTRLEN] = {};
    in_addr a{};
    a.s_addr = to_network();
    if (inet_ntop(AF_INET, &a, buf, sizeof(buf)) == nullptr) return {};
    return buf;
}

Ipv4Address from_network(std::uint32_t be) noexcept {
    Ipv4Address out;
    std::memcpy(out.octets.data(), &be, sizeof(be));
    return out;
}

} // namespace uplink::net
