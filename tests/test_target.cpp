#include <doctest/doctest.h>
#include "target.hpp"

using namespace dacwire;

TEST_CASE("Dotted quad with a port is TCP over IPv4") {
    TransportTarget t;
    Error err;
    REQUIRE(resolve_target("192.168.1.100:8080", t, err));
    CHECK(t.kind == TargetKind::TcpV4);
    CHECK(t.host == "192.168.1.100");
    CHECK(t.port == 8080);
    CHECK(t.is_tcp());
    CHECK(t.to_string() == "192.168.1.100:8080");
}

TEST_CASE("Bracketed address with a port is TCP over IPv6") {
    TransportTarget t;
    Error err;
    REQUIRE(resolve_target("[::1]:2012", t, err));
    CHECK(t.kind == TargetKind::TcpV6);
    CHECK(t.host == "::1");
    CHECK(t.port == 2012);
    CHECK(t.to_string() == "[::1]:2012");

    REQUIRE(resolve_target("[fe80::1%eth0]:80", t, err));
    CHECK(t.host == "fe80::1%eth0");
}

TEST_CASE("Everything else is an opaque serial path") {
    TransportTarget t;
    Error err;
    REQUIRE(resolve_target("/dev/ttyACM0", t, err));
    CHECK(t.kind == TargetKind::SerialPath);
    CHECK(t.path == "/dev/ttyACM0");
    CHECK_FALSE(t.is_tcp());

    REQUIRE(resolve_target("COM5", t, err));
    CHECK(t.kind == TargetKind::SerialPath);

    REQUIRE(resolve_target("localhost:8080", t, err));     // not numeric, so a path
    CHECK(t.kind == TargetKind::SerialPath);

    REQUIRE(resolve_target("192.168.1.100", t, err));       // no port
    CHECK(t.kind == TargetKind::SerialPath);
}

TEST_CASE("TCP-shaped targets with unusable ports are rejected") {
    TransportTarget t;
    Error err;
    const char* bad[] = {"10.0.0.1:0", "10.0.0.1:65536", "10.0.0.1:", "10.0.0.1:80x", "[::1]:", "[::1]:-1"};
    for (const char* s : bad) {
        err.clear();
        CHECK_FALSE(resolve_target(s, t, err));
        CHECK(err.kind == ErrorKind::InvalidTarget);
        CHECK(err.reason == "invalid_target:port");
    }
    CHECK(exit_code_for(ErrorKind::InvalidTarget) == EXIT_INVALID_TARGET);
}

TEST_CASE("Empty target is invalid") {
    TransportTarget t;
    Error err;
    CHECK_FALSE(resolve_target("", t, err));
    CHECK(err.reason == "invalid_target:empty");
}
