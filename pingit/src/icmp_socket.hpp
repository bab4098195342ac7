#pragma once

// An open ICMPv4 socket. Prefers an unprivileged ping socket and falls back
// to a raw one; closes on destruction.
class IcmpSocket {
public:
    enum class Kind { Ping, Raw };

    // Not open when neither kind is permitted; errno is left from the last attempt.
    static IcmpSocket open();

    IcmpSocket() = default;
    ~IcmpSocket();

    IcmpSocket(const IcmpSocket&) = delete;
    IcmpSocket& operator=(const IcmpSocket&) = delete;
    IcmpSocket(IcmpSocket&& other) noexcept;
    IcmpSocket& operator=(IcmpSocket&& other) noexcept;

    int fd() const { return fd_; }
    Kind kind() const { return kind_; }
    explicit operator bool() const { return fd_ >= 0; }

    // Raw sockets deliver the IP header in front of each message.
    bool delivers_ip_header() const { return kind_ == Kind::Raw; }

private:
    IcmpSocket(int fd, Kind kind) : fd_(fd), kind_(kind) {}
    void close();

    int fd_ = -1;
    Kind kind_ = Kind::Ping;
};
