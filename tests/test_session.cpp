#include <doctest/doctest.h>
#include <cerrno>
#include <sstream>
#include "fake_transport.hpp"
#include "session.hpp"

using namespace dacwire;
using dacwire::test::FakeTransport;
using dacwire::test::RxStep;
using dacwire::test::TxStep;

namespace {

// Session over a FakeTransport with logging captured in memory.
struct Rig {
    std::ostringstream out, err;
    Logger             log{true, false, out, err};
    FakeTransport::Log io;
    FakeTransport*     link{nullptr};
    std::unique_ptr<Session> session;

    explicit Rig(SessionConfig cfg = SessionConfig{}) {
        auto t = std::make_unique<FakeTransport>(io);
        link = t.get();
        session = std::make_unique<Session>(std::move(t), cfg, log);
    }
};

Command dac(uint8_t ch, uint16_t v) {
    Command c;
    make_dac_write(ch, v, c);
    return c;
}

RxStep reply(std::vector<uint8_t> bytes) {
    RxStep s;
    s.result = bytes.empty() ? transport::RxResult::None : transport::RxResult::Ok;
    s.bytes = bytes;
    return s;
}

} // namespace

TEST_CASE("One write per command and one read for a full status reply") {
    Rig rig;
    rig.link->rx_script.push_back(reply({0x00, 0x00}));

    SendResult r = rig.session->send(dac(3, 0x1000));
    CHECK(r.status == SendStatus::Ok);
    CHECK(r.bytes_written == 4);
    CHECK(r.response_requested);
    CHECK(r.response.kind == ResponseKind::Bytes);
    CHECK(r.response.status_ok());

    REQUIRE(rig.io.writes.size() == 1);
    CHECK(rig.io.writes[0] == std::vector<uint8_t>{0x03, 0x00, 0x10, 0x00});
    CHECK(rig.io.recv_calls == 1);

    const SessionStats& s = rig.session->stats();
    CHECK(s.commands_sent == 1);
    CHECK(s.responses_received == 1);
    CHECK(s.bytes_sent == 4);
    CHECK(s.bytes_received == 2);
    CHECK(s.response_rate() == doctest::Approx(100.0));
}

TEST_CASE("Opcode filter decides which frames are followed by a read") {
    SessionConfig cfg;
    cfg.response_opcodes = {OP_GPIO, OP_KEEPALIVE, OP_LDAC};
    Rig rig(cfg);

    SendResult r = rig.session->send(dac(1, 511));
    CHECK_FALSE(r.response_requested);
    CHECK(rig.io.recv_calls == 0);

    rig.link->rx_script.push_back(reply({0x00, 0x00}));
    r = rig.session->send(make_keepalive());
    CHECK(r.response_requested);
    CHECK(rig.io.recv_calls == 1);
    CHECK(rig.session->stats().keepalives_sent == 1);
}

TEST_CASE("Disabled responses never read") {
    SessionConfig cfg;
    cfg.read_responses = false;
    Rig rig(cfg);
    rig.session->send(make_ldac());
    rig.session->send(make_keepalive());
    CHECK(rig.io.recv_calls == 0);
    CHECK(rig.session->stats().response_rate() == doctest::Approx(0.0));
}

TEST_CASE("Missing and short replies are soft timeouts") {
    Rig rig;
    rig.link->rx_script.push_back(reply({}));
    rig.link->rx_script.push_back(reply({0x00}));

    SendResult r = rig.session->send(make_ldac());
    CHECK(r.status == SendStatus::Timeout);
    CHECK(r.error.reason == "read_timeout");
    CHECK(r.response.kind == ResponseKind::Empty);

    r = rig.session->send(make_ldac());
    CHECK(r.status == SendStatus::Timeout);
    CHECK(r.error.reason == "partial_response");
    CHECK(r.response.kind == ResponseKind::Partial);

    const SessionStats& s = rig.session->stats();
    CHECK(s.timeouts == 2);
    CHECK(s.responses_received == 1);
    CHECK(s.errors == 0);
    CHECK(rig.session->is_open());
    CHECK(rig.out.str().find("read Empty") != std::string::npos);
}

TEST_CASE("Short write at the deadline is a timeout and skips the read") {
    Rig rig;
    TxStep partial;
    partial.result = transport::TxResult::Timeout;
    partial.written = 2;
    rig.link->tx_script.push_back(partial);

    SendResult r = rig.session->send(dac(0, 1));
    CHECK(r.status == SendStatus::Timeout);
    CHECK(r.bytes_written == 2);
    CHECK(r.error.reason == "write_timeout");
    CHECK(rig.io.recv_calls == 0);
    CHECK(rig.session->stats().bytes_sent == 2);
}

TEST_CASE("Channel errors are write failures") {
    Rig rig;
    TxStep broken;
    broken.result = transport::TxResult::Error;
    broken.written = 0;
    broken.err = EPIPE;
    rig.link->tx_script.push_back(broken);

    SendResult r = rig.session->send(dac(0, 1));
    CHECK(r.failed());
    CHECK(r.error.kind == ErrorKind::WriteFailure);
    CHECK(r.error.os_errno == EPIPE);
    CHECK(rig.session->stats().errors == 1);
    CHECK(rig.session->stats().commands_sent == 0);
    CHECK(exit_code_for(r.error.kind) == EXIT_CONNECTION);

    RxStep closed;
    closed.result = transport::RxResult::Closed;
    rig.link->rx_script.push_back(closed);
    r = rig.session->send(make_ldac());
    CHECK(r.failed());
    CHECK(r.error.reason == "peer_closed");
}

TEST_CASE("Keepalive goes out exactly once per quiet interval") {
    SessionConfig cfg;
    cfg.keepalive_interval_ms = 5000;
    Rig rig(cfg);
    rig.session->start_clock(0);

    int sent = 0;
    for (uint32_t now = 0; now <= 20000; now += 100) {
        if (rig.session->tick(now)) ++sent;
    }
    CHECK(sent == 4);
    CHECK(rig.session->stats().keepalives_sent == 4);
    for (const auto& w : rig.io.writes) CHECK(w[0] == OP_KEEPALIVE);
}

TEST_CASE("A keepalive cut short at the write deadline is retried on the next tick") {
    SessionConfig cfg;
    cfg.keepalive_interval_ms = 5000;
    Rig rig(cfg);
    rig.session->start_clock(0);

    TxStep partial;
    partial.result = transport::TxResult::Timeout;
    partial.written = 2;
    rig.link->tx_script.push_back(partial);

    SendResult r;
    REQUIRE(rig.session->tick(5000, &r));
    CHECK(r.status == SendStatus::Timeout);
    CHECK_FALSE(r.frame_written());

    rig.link->rx_script.push_back(reply({0x00, 0x00}));
    REQUIRE(rig.session->tick(5100, &r));
    CHECK(r.frame_written());
    CHECK(rig.io.writes.size() == 2);

    CHECK_FALSE(rig.session->tick(5200));
    CHECK(rig.session->tick(10100));
}

TEST_CASE("A keepalive whose reply times out still restarts the clock") {
    SessionConfig cfg;
    cfg.keepalive_interval_ms = 5000;
    Rig rig(cfg);
    rig.session->start_clock(0);
    rig.link->rx_script.push_back(reply({}));

    SendResult r;
    REQUIRE(rig.session->tick(5000, &r));
    CHECK(r.status == SendStatus::Timeout);
    CHECK(r.frame_written());
    CHECK_FALSE(rig.session->tick(5100));
}

TEST_CASE("Zero keepalive interval disables tick") {
    SessionConfig cfg;
    cfg.keepalive_interval_ms = 0;
    Rig rig(cfg);
    rig.session->start_clock(0);
    CHECK_FALSE(rig.session->tick(100000));
    CHECK(rig.io.writes.empty());
}

TEST_CASE("Replies come from a device model when no script is queued") {
    Rig rig;
    DeviceModel dev;
    rig.link->device = &dev;

    CHECK(rig.session->send(dac(6, 42)).response.status_ok());
    CHECK(dev.dac(6) == 42);

    Command g;
    REQUIRE(make_gpio_set(0, true, g));
    rig.session->send(g);
    CHECK(dev.gpio(0));
}

TEST_CASE("Shutdown clears the requested pins and closes the link") {
    Rig rig;
    DeviceModel dev;
    rig.link->device = &dev;

    Command g;
    REQUIRE(make_gpio_set(1, true, g));
    rig.session->send(g);
    CHECK(rig.session->shutdown({0, 1}));
    CHECK_FALSE(dev.gpio(1));
    CHECK_FALSE(rig.session->is_open());
    CHECK(rig.io.end_calls == 1);

    SendResult r = rig.session->send(make_keepalive());
    CHECK(r.failed());
    CHECK(r.error.reason == "not_open");
}
