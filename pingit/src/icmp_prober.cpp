#include "icmp_prober.hpp"
#include "icmp_socket.hpp"
#include <spdlog/spdlog.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <array>
#include <cerrno>
#include <cstddef>
#include <chrono>
#include <cstring>

namespace {

constexpr size_t kPayloadSize = 56;

bool resolve_ipv4(const std::string& host, sockaddr_in& out) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_RAW;
    addrinfo* result = nullptr;

    int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (rc != 0 || !result) {
        spdlog::debug("Cannot resolve {}: {}", host, gai_strerror(rc));
        return false;
    }
    std::memcpy(&out, result->ai_addr, sizeof(sockaddr_in));
    ::freeaddrinfo(result);
    return true;
}

bool is_unreachable_errno(int err) {
    return err == EHOSTUNREACH || err == ENETUNREACH || err == ECONNREFUSED || err == EHOSTDOWN;
}

} // namespace

uint16_t icmp_checksum(const void* data, size_t length) {
    const auto* bytes = static_cast<const uint8_t*>(data);
    uint32_t sum = 0;
    for (; length > 1; length -= 2, bytes += 2) {
        uint16_t word;
        std::memcpy(&word, bytes, sizeof(word));
        sum += word;
    }
    if (length == 1) {
        sum += *bytes;
    }
    sum = (sum >> 16) + (sum & 0xFFFF);
    sum += (sum >> 16);
    return static_cast<uint16_t>(~sum);
}

IcmpEchoProber::IcmpEchoProber()
    : identifier_(static_cast<uint16_t>(::getpid() & 0xFFFF)) {}

ProbeOutcome IcmpEchoProber::probe(const Target& target) {
    using namespace std::chrono;
    const auto deadline = steady_clock::now() + target.timeout;

    sockaddr_in addr{};
    if (!resolve_ipv4(target.host, addr)) {
        return ProbeOutcome::failure(ErrorKind::HostResolutionFailed);
    }

    IcmpSocket sock = IcmpSocket::open();
    if (!sock) {
        if (!socket_error_logged_.exchange(true)) {
            spdlog::error("Cannot open ICMP socket: {} (need net.ipv4.ping_group_range or CAP_NET_RAW)",
                          std::strerror(errno));
        }
        return ProbeOutcome::failure(ErrorKind::Unreachable);
    }

    const uint16_t sequence = next_sequence_++;
    std::array<uint8_t, sizeof(icmphdr) + kPayloadSize> packet{};
    icmphdr header{};
    header.type = ICMP_ECHO;
    header.code = 0;
    header.un.echo.id = htons(identifier_);
    header.un.echo.sequence = htons(sequence);
    std::memcpy(packet.data(), &header, sizeof(header));
    for (size_t i = 0; i < kPayloadSize; ++i) {
        packet[sizeof(icmphdr) + i] = static_cast<uint8_t>(i);
    }
    uint16_t checksum = icmp_checksum(packet.data(), packet.size());
    std::memcpy(packet.data() + offsetof(icmphdr, checksum), &checksum, sizeof(checksum));

    const auto sent_at = steady_clock::now();
    if (::sendto(sock.fd(), packet.data(), packet.size(), 0,
                 reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::debug("sendto {} failed: {}", target.host, std::strerror(errno));
        return ProbeOutcome::failure(ErrorKind::Unreachable);
    }

    std::array<uint8_t, 1500> buffer{};
    while (true) {
        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        if (remaining.count() <= 0) {
            return ProbeOutcome::failure(ErrorKind::Timeout);
        }

        pollfd pfd{sock.fd(), POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            spdlog::debug("poll on ICMP socket failed: {}", std::strerror(errno));
            return ProbeOutcome::failure(ErrorKind::Unreachable);
        }
        if (rc == 0) {
            return ProbeOutcome::failure(ErrorKind::Timeout);
        }

        ssize_t n = ::recv(sock.fd(), buffer.data(), buffer.size(), 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (is_unreachable_errno(errno)) {
                spdlog::debug("{} reported unreachable: {}", target.host, std::strerror(errno));
                return ProbeOutcome::failure(ErrorKind::Unreachable);
            }
            spdlog::debug("recv on ICMP socket failed: {}", std::strerror(errno));
            return ProbeOutcome::failure(ErrorKind::Unreachable);
        }

        size_t offset = 0;
        if (sock.delivers_ip_header()) {
            if (static_cast<size_t>(n) < sizeof(iphdr)) continue;
            iphdr ip{};
            std::memcpy(&ip, buffer.data(), sizeof(ip));
            offset = ip.ihl * 4u;
        }
        if (static_cast<size_t>(n) < offset + sizeof(icmphdr)) continue;

        icmphdr reply{};
        std::memcpy(&reply, buffer.data() + offset, sizeof(reply));

        if (reply.type == ICMP_ECHOREPLY) {
            // The kernel rewrites the identifier on ping sockets.
            if (ntohs(reply.un.echo.sequence) != sequence) continue;
            if (sock.kind() == IcmpSocket::Kind::Raw && ntohs(reply.un.echo.id) != identifier_) continue;
            auto rtt = duration<double, std::milli>(steady_clock::now() - sent_at).count();
            return ProbeOutcome::success(rtt);
        }

        if (reply.type == ICMP_DEST_UNREACH) {
            // Body carries the original IP header and the first 8 bytes of our echo.
            size_t inner = offset + sizeof(icmphdr);
            if (static_cast<size_t>(n) < inner + sizeof(iphdr)) continue;
            iphdr original_ip{};
            std::memcpy(&original_ip, buffer.data() + inner, sizeof(original_ip));
            inner += original_ip.ihl * 4u;
            if (static_cast<size_t>(n) < inner + sizeof(icmphdr)) continue;
            icmphdr original{};
            std::memcpy(&original, buffer.data() + inner, sizeof(original));
            if (ntohs(original.un.echo.sequence) != sequence) continue;
            if (sock.kind() == IcmpSocket::Kind::Raw && ntohs(original.un.echo.id) != identifier_) continue;
            return ProbeOutcome::failure(ErrorKind::Unreachable);
        }
    }
}
