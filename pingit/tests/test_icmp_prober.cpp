#include <gtest/gtest.h>
#include "icmp_prober.hpp"
#include "icmp_socket.hpp"
#include "test_helpers.hpp"
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <utility>

TEST(IcmpChecksum, MatchesReferenceVector) {
    // Echo request header, id 0x1234 seq 1, checksum field zeroed.
    const uint8_t packet[] = {0x08, 0x00, 0x00, 0x00, 0x12, 0x34, 0x00, 0x01};
    uint16_t sum = icmp_checksum(packet, sizeof(packet));

    uint8_t with_sum[sizeof(packet)];
    std::memcpy(with_sum, packet, sizeof(packet));
    std::memcpy(with_sum + 2, &sum, sizeof(sum));
    EXPECT_EQ(icmp_checksum(with_sum, sizeof(with_sum)), 0);
}

TEST(IcmpChecksum, HandlesOddLength) {
    const uint8_t data[] = {0xFF};
    EXPECT_EQ(icmp_checksum(data, sizeof(data)), 0xFF00);
}

TEST(IcmpEchoProber, UnresolvableHostIsResolutionFailure) {
    IcmpEchoProber prober;
    auto outcome = prober.probe(make_target("bad", "name.invalid", std::chrono::seconds(1),
                                            std::chrono::milliseconds(500)));
    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error, ErrorKind::HostResolutionFailed);
}

TEST(ProbeOutcome, Factories) {
    auto ok = ProbeOutcome::success(3.5);
    EXPECT_TRUE(ok.ok());
    EXPECT_DOUBLE_EQ(*ok.rtt_ms, 3.5);

    auto failed = ProbeOutcome::failure(ErrorKind::Unreachable);
    EXPECT_FALSE(failed.ok());
    EXPECT_EQ(failed.error, ErrorKind::Unreachable);
}

TEST(IcmpSocket, MoveTransfersOwnership) {
    IcmpSocket sock = IcmpSocket::open();
    if (!sock) {
        GTEST_SKIP() << "no ICMP socket permitted here";
    }
    const int fd = sock.fd();
    const bool raw = sock.kind() == IcmpSocket::Kind::Raw;
    EXPECT_EQ(sock.delivers_ip_header(), raw);

    IcmpSocket moved = std::move(sock);
    EXPECT_FALSE(sock);
    EXPECT_EQ(moved.fd(), fd);

    { IcmpSocket sink = std::move(moved); }
    EXPECT_EQ(::fcntl(fd, F_GETFD), -1);
}

TEST(IcmpSocket, DefaultIsClosed) {
    IcmpSocket sock;
    EXPECT_FALSE(sock);
    EXPECT_EQ(sock.fd(), -1);
}
