#include <doctest/doctest.h>
#include "dacwire/session_clock.hpp"

using namespace dacwire;

TEST_CASE("First due() starts the window instead of firing") {
    SessionClock clk(5000);
    CHECK_FALSE(clk.due(1000));
    CHECK_FALSE(clk.due(5999));
    CHECK(clk.due(6000));
}

TEST_CASE("Only the first due() moves an unstarted clock") {
    SessionClock clk(1000);
    CHECK(clk.remaining_ms(0) == 1000);
    CHECK_FALSE(clk.due(200));
    CHECK(clk.remaining_ms(700) == 500);
    CHECK_FALSE(clk.due(700));
    CHECK(clk.remaining_ms(900) == 300);
    CHECK(clk.due(1200));
}

TEST_CASE("due() stays true until reset") {
    SessionClock clk(100);
    clk.start(0);
    CHECK(clk.due(150));
    CHECK(clk.due(160));
    clk.reset(160);
    CHECK_FALSE(clk.due(259));
    CHECK(clk.due(260));
}

TEST_CASE("Zero interval disables the clock") {
    SessionClock clk(0);
    clk.start(0);
    CHECK_FALSE(clk.due(1000000));
    CHECK(clk.remaining_ms(5) == 0);
}

TEST_CASE("Elapsed time survives the 32-bit millisecond wrap") {
    SessionClock clk(1000);
    clk.start(0xFFFFFF00u);
    CHECK_FALSE(clk.due(0x00000100u));      // 512 ms later
    CHECK(clk.remaining_ms(0x00000100u) == 488);
    CHECK(clk.due(0x000002E8u));            // 1000 ms later
}
