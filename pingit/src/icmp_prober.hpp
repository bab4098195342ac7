#pragma once
#include "types.hpp"
#include <atomic>
#include <cstdint>
#include <optional>

struct ProbeOutcome {
    std::optional<double> rtt_ms;
    ErrorKind error = ErrorKind::Timeout;

    bool ok() const { return rtt_ms.has_value(); }

    static ProbeOutcome success(double rtt) { return ProbeOutcome{rtt, ErrorKind::Timeout}; }
    static ProbeOutcome failure(ErrorKind kind) { return ProbeOutcome{std::nullopt, kind}; }
};

// One reachability check. Implementations must return within the target's
// timeout and must be safe to call from several threads at once.
class EchoProber {
public:
    virtual ~EchoProber() = default;
    virtual ProbeOutcome probe(const Target& target) = 0;
};

// ICMP echo over IPv4. Uses an unprivileged ping socket when the kernel
// allows it, otherwise a raw socket (CAP_NET_RAW).
class IcmpEchoProber : public EchoProber {
public:
    IcmpEchoProber();

    ProbeOutcome probe(const Target& target) override;

private:
    uint16_t identifier_;
    std::atomic<uint16_t> next_sequence_{1};
    std::atomic<bool> socket_error_logged_{false};
};

uint16_t icmp_checksum(const void* data, size_t length);
