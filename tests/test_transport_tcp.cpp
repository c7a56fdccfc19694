#include <doctest/doctest.h>
#include <cstring>
#include <string>
#include <poll.h>
#include "dacwire/transport/transport_linux_tcp.hpp"
#include "fd_io.hpp"
#include "tcp_listener.hpp"
#include "transport_factory.hpp"

using namespace dacwire;

namespace {

// Loopback listener with one accepted peer.
struct Loopback {
    int listen_fd{-1};
    int peer_fd{-1};
    uint16_t port{0};

    Loopback() {
        int err = 0;
        listen_fd = listen_tcp("127.0.0.1", 0, err);
        port = bound_port(listen_fd);
    }
    ~Loopback() {
        close_socket(peer_fd);
        close_socket(listen_fd);
    }

    bool accept_peer() {
        std::string who;
        for (int i = 0; i < 100 && peer_fd < 0; ++i) {
            peer_fd = accept_client(listen_fd, who);
            if (peer_fd < 0) {
                pollfd p{listen_fd, POLLIN, 0};
                ::poll(&p, 1, 10);
            }
        }
        return peer_fd >= 0;
    }
};

} // namespace

TEST_CASE("TCP transport writes frames and reads replies over loopback") {
    Loopback lb;
    REQUIRE(lb.listen_fd >= 0);
    REQUIRE(lb.port != 0);

    transport::TcpConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = lb.port;
    cfg.read_timeout_ms = 200;
    transport::LinuxTcp tcp;
    REQUIRE(tcp.begin(cfg));
    REQUIRE(lb.accept_peer());
    CHECK(tcp.kind() == transport::Kind::Tcp);

    const uint8_t frame[4] = {0x03, 0x00, 0x10, 0x00};
    size_t written = 0;
    CHECK(tcp.send(frame, 4, written) == transport::TxResult::Ok);
    CHECK(written == 4);

    uint8_t got[4] = {0};
    IoResult rr = read_bounded(lb.peer_fd, got, 4, 4, 500);
    REQUIRE(rr.status == IoStatus::Ok);
    CHECK(std::memcmp(got, frame, 4) == 0);

    const uint8_t status[2] = {0x00, 0x00};
    REQUIRE(write_bounded(lb.peer_fd, status, 2, 500, true).status == IoStatus::Ok);

    uint8_t reply[2] = {0xAA, 0xAA};
    size_t n = 0;
    CHECK(tcp.recv(reply, 2, 2, n) == transport::RxResult::Ok);
    CHECK(n == 2);
    CHECK(reply[0] == 0x00);
}

TEST_CASE("TCP read with nothing pending times out softly") {
    Loopback lb;
    transport::TcpConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = lb.port;
    cfg.read_timeout_ms = 50;
    transport::LinuxTcp tcp;
    REQUIRE(tcp.begin(cfg));
    REQUIRE(lb.accept_peer());

    uint8_t buf[2];
    size_t n = 0;
    const uint32_t t0 = now_ms_steady32();
    CHECK(tcp.recv(buf, 2, 2, n) == transport::RxResult::None);
    CHECK(n == 0);
    CHECK(now_ms_steady32() - t0 >= 40);
    CHECK(tcp.is_open());
}

TEST_CASE("Peer closing the socket is reported as Closed") {
    Loopback lb;
    transport::TcpConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = lb.port;
    transport::LinuxTcp tcp;
    REQUIRE(tcp.begin(cfg));
    REQUIRE(lb.accept_peer());

    close_socket(lb.peer_fd);
    lb.peer_fd = -1;

    uint8_t buf[2];
    size_t n = 0;
    CHECK(tcp.recv(buf, 2, 2, n) == transport::RxResult::Closed);
}

TEST_CASE("Connecting to a closed port fails with a connection error") {
    uint16_t port = 0;
    {
        Loopback lb;          // grab a free port, then release it
        port = lb.port;
    }
    TransportTarget t;
    t.kind = TargetKind::TcpV4;
    t.host = "127.0.0.1";
    t.port = port;

    LinkConfig lc;
    lc.connect_timeout_ms = 500;
    Error err;
    auto link = open_transport(t, lc, err);
    CHECK(link == nullptr);
    CHECK(err.kind == ErrorKind::ConnectionError);
    CHECK(err.reason == "connect_refused");
}
