/**
 * @file icmp_pinger.cpp
 * @brief ICMP echo implementation of Pinger.
 */
#include "uplink/probe/icmp_pinger.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string>

#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace uplink::probe {

namespace {

using Clock = std::chrono::steady_clock;

/// Upper bound on how long a stop request can go unnoticed.
constexpr auto kPollSlice = std::chrono::milliseconds(100);
constexpr std::size_t kPayloadLen = 16;

std::atomic<std::uint16_t> g_next_ident{static_cast<std::uint16_t>(::getpid())};

/// Owning socket descriptor.
class Socket {
public:
    Socket() noexcept = default;
    Socket(int fd, bool raw) noexcept : fd_(fd), raw_(raw) {}
    ~Socket() { if (fd_ >= 0) ::close(fd_); }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    int fd() const noexcept { return fd_; }
    bool raw() const noexcept { return raw_; }
    bool valid() const noexcept { return fd_ >= 0; }
private:
    int fd_{-1};
    bool raw_{false};
};

Socket open_socket() {
    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_ICMP);
    if (fd >= 0) return Socket{fd, false};
    fd = ::socket(AF_INET, SOCK_RAW | SOCK_CLOEXEC, IPPROTO_ICMP);
    return Socket{fd, true};
}

// RFC 1071 one's-complement sum.
std::uint16_t checksum(const std::uint8_t* data, std::size_t len) noexcept {
    std::uint32_t sum = 0;
    for (std::size_t i = 0; i + 1 < len; i += 2) {
        sum += static_cast<std::uint32_t>((data[i] << 8) | data[i + 1]);
    }
    if (len & 1) sum += static_cast<std::uint32_t>(data[len - 1] << 8);
    while (sum >> 16) sum = (sum & 0xFFFF) + (sum >> 16);
    return htons(static_cast<std::uint16_t>(~sum));
}

bool send_echo(const Socket& s, const sockaddr_in& to, std::uint16_t ident, std::uint16_t seq) {
    std::array<std::uint8_t, sizeof(icmphdr) + kPayloadLen> pkt{};
    icmphdr hdr{};
    hdr.type = ICMP_ECHO;
    hdr.code = 0;
    hdr.un.echo.id = htons(ident);
    hdr.un.echo.sequence = htons(seq);
    std::memcpy(pkt.data(), &hdr, sizeof(hdr));
    for (std::size_t i = 0; i < kPayloadLen; ++i) pkt[sizeof(hdr) + i] = static_cast<std::uint8_t>(i);

    const std::uint16_t sum = checksum(pkt.data(), pkt.size());
    std::memcpy(pkt.data() + offsetof(icmphdr, checksum), &sum, sizeof(sum));

    const auto n = ::sendto(s.fd(), pkt.data(), pkt.size(), 0,
                            reinterpret_cast<const sockaddr*>(&to), sizeof(to));
    return n == static_cast<ssize_t>(pkt.size());
}

bool is_our_reply(const Socket& s, const std::uint8_t* buf, std::size_t len,
                  std::uint16_t ident, std::uint16_t seq) noexcept {
    std::size_t off = 0;
    if (s.raw()) {
        if (len < sizeof(iphdr)) return false;
        iphdr ip{};
        std::memcpy(&ip, buf, sizeof(ip));
        off = static_cast<std::size_t>(ip.ihl) * 4;
    }
    if (len < off + sizeof(icmphdr)) return false;

    icmphdr hdr{};
    std::memcpy(&hdr, buf + off, sizeof(hdr));
    if (hdr.type != ICMP_ECHOREPLY) return false;
    if (ntohs(hdr.un.echo.sequence) != seq) return false;
    // Datagram sockets: the kernel rewrites the id and filters replies for us.
    return !s.raw() || ntohs(hdr.un.echo.id) == ident;
}

/// Wait up to @p timeout for a matching reply.
bool await_reply(const Socket& s, const sockaddr_in& from_expected,
                 std::uint16_t ident, std::uint16_t seq,
                 std::chrono::milliseconds timeout, const std::stop_token& stop) {
    const auto deadline = Clock::now() + timeout;
    std::array<std::uint8_t, 1500> buf{};

    while (!stop.stop_requested()) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left.count() <= 0) return false;

        pollfd pfd{s.fd(), POLLIN, 0};
        const int rc = ::poll(&pfd, 1, static_cast<int>(std::min(left, kPollSlice).count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (rc == 0) continue;

        sockaddr_in from{};
        socklen_t from_len = sizeof(from);
        const auto n = ::recvfrom(s.fd(), buf.data(), buf.size(), MSG_DONTWAIT,
                                  reinterpret_cast<sockaddr*>(&from), &from_len);
        if (n <= 0) continue;
        if (from.sin_addr.s_addr != from_expected.sin_addr.s_addr) continue;
        if (is_our_reply(s, buf.data(), static_cast<std::size_t>(n), ident, seq)) return true;
    }
    return false;
}

} // namespace

bool IcmpPinger::reachable(std::string_view iface,
                           const net::Ipv4Address& target,
                           const PingParams& params,
                           std::stop_token stop) {
    Socket s = open_socket();
    if (!s.valid()) return false;

    const std::string dev(iface);
    if (::setsockopt(s.fd(), SOL_SOCKET, SO_BINDTODEVICE, dev.c_str(),
                     static_cast<socklen_t>(dev.size() + 1)) < 0) {
        return false;
    }

    sockaddr_in to{};
    to.sin_family = AF_INET;
    to.sin_addr.s_addr = target.to_network();

    const std::uint16_t ident = g_next_ident.fetch_add(1, std::memory_order_relaxed);
    for (std::uint32_t attempt = 0; attempt < params.attempts; ++attempt) {
        if (stop.stop_requested()) return false;
        const auto seq = static_cast<std::uint16_t>(attempt + 1);
        if (!send_echo(s, to, ident, seq)) continue; // e.g. ENETUNREACH: counts as a lost attempt
        if (await_reply(s, to, ident, seq, params.timeout, stop)) return true;
    }
    return false;
}

} // namespace uplink::probe
