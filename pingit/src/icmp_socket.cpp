#include "icmp_socket.hpp"
#include <spdlog/spdlog.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

IcmpSocket IcmpSocket::open() {
    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_ICMP);
    if (fd >= 0) {
        // Surface ICMP errors for this socket through recv().
        int on = 1;
        if (::setsockopt(fd, IPPROTO_IP, IP_RECVERR, &on, sizeof(on)) < 0) {
            spdlog::debug("IP_RECVERR not available: {}", std::strerror(errno));
        }
        return IcmpSocket(fd, Kind::Ping);
    }

    fd = ::socket(AF_INET, SOCK_RAW | SOCK_CLOEXEC, IPPROTO_ICMP);
    if (fd >= 0) {
        return IcmpSocket(fd, Kind::Raw);
    }
    return IcmpSocket();
}

IcmpSocket::~IcmpSocket() {
    close();
}

IcmpSocket::IcmpSocket(IcmpSocket&& other) noexcept : fd_(other.fd_), kind_(other.kind_) {
    other.fd_ = -1;
}

IcmpSocket& IcmpSocket::operator=(IcmpSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        kind_ = other.kind_;
        other.fd_ = -1;
    }
    return *this;
}

void IcmpSocket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}
