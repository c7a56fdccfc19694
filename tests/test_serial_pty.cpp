#include <doctest/doctest.h>
#include <cstring>
#include <pty.h>
#include <termios.h>
#include <unistd.h>
#include "dacwire/transport/transport_linux_serial.hpp"
#include "fd_io.hpp"
#include "transport_factory.hpp"

using namespace dacwire;

namespace {

// Pseudo-terminal pair; the slave side plays the serial device node.
struct Pty {
    int master{-1};
    int slave{-1};
    char name[128] = {0};

    Pty() {
        if (::openpty(&master, &slave, name, nullptr, nullptr) != 0) return;
        termios t;
        if (::tcgetattr(master, &t) == 0) {
            ::cfmakeraw(&t);
            ::tcsetattr(master, TCSANOW, &t);
        }
    }
    ~Pty() {
        if (slave >= 0) ::close(slave);
        if (master >= 0) ::close(master);
    }
};

} // namespace

TEST_CASE("Serial transport exchanges a frame and a status over a pty") {
    Pty pty;
    REQUIRE(pty.master >= 0);

    transport::SerialConfig cfg;
    cfg.path = pty.name;
    cfg.read_timeout_ms = 200;
    transport::LinuxSerial serial;
    REQUIRE(serial.begin(cfg));
    CHECK(serial.kind() == transport::Kind::Serial);
    CHECK(serial.path() == pty.name);

    const uint8_t frame[4] = {0xFE, 0x01, 0x00, 0x01};
    size_t written = 0;
    CHECK(serial.send(frame, 4, written) == transport::TxResult::Ok);

    uint8_t got[4] = {0};
    IoResult rr = read_bounded(pty.master, got, 4, 4, 500);
    REQUIRE(rr.status == IoStatus::Ok);
    CHECK(std::memcmp(got, frame, 4) == 0);

    const uint8_t status[2] = {0x00, 0x00};
    REQUIRE(::write(pty.master, status, 2) == 2);

    uint8_t reply[2];
    size_t n = 0;
    CHECK(serial.recv(reply, 2, 2, n) == transport::RxResult::Ok);
    CHECK(n == 2);
}

TEST_CASE("Serial read without a reply is a soft timeout") {
    Pty pty;
    REQUIRE(pty.master >= 0);

    transport::SerialConfig cfg;
    cfg.path = pty.name;
    cfg.read_timeout_ms = 30;
    transport::LinuxSerial serial;
    REQUIRE(serial.begin(cfg));

    uint8_t reply[2];
    size_t n = 0;
    CHECK(serial.recv(reply, 2, 2, n) == transport::RxResult::None);
    CHECK(serial.is_open());
}

TEST_CASE("Opening a missing device is a connection error") {
    TransportTarget t;
    t.kind = TargetKind::SerialPath;
    t.path = "/dev/dacwire-does-not-exist";

    Error err;
    auto link = open_transport(t, LinkConfig{}, err);
    CHECK(link == nullptr);
    CHECK(err.kind == ErrorKind::ConnectionError);
    CHECK(err.reason.rfind("open_failed", 0) == 0);
}
