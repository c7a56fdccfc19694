#include <doctest/doctest.h>
#include "command_dispatch.hpp"

using namespace dacwire;

static std::vector<Command> build(std::vector<std::string> words, std::string& err) {
    std::vector<Command> out;
    if (!build_from_tokens(words, out, err)) out.clear();
    return out;
}

TEST_CASE("Command words become commands") {
    std::string err;
    auto c = build({"dac", "3", "0x1000"}, err);
    REQUIRE(c.size() == 1);
    CHECK(c[0].kind == CommandKind::DacWrite);
    CHECK(c[0].channel == 3);
    CHECK(c[0].value == 0x1000);

    c = build({"BIND", "2", "1"}, err);
    REQUIRE(c.size() == 1);
    CHECK(c[0].kind == CommandKind::AttachTable);

    c = build({"gpio", "1", "ON"}, err);
    REQUIRE(c.size() == 1);
    CHECK(c[0].on);

    c = build({"ka"}, err);
    REQUIRE(c.size() == 1);
    CHECK(c[0].kind == CommandKind::KeepAlive);
}

TEST_CASE("rs422 expands into two register writes") {
    std::string err;
    auto c = build({"rs422", "2000000"}, err);
    REQUIRE(c.size() == 2);
    CHECK(c[0] == make_register_write(1, 30));
    CHECK(c[1] == make_register_write(2, 33920));
}

TEST_CASE("Bad words report a stable reason") {
    std::string err;
    CHECK(build({}, err).empty());
    CHECK(err == "empty_command");
    CHECK(build({"blink"}, err).empty());
    CHECK(err == "unknown_command:blink");
    CHECK(build({"dac", "3"}, err).empty());
    CHECK(err == "bad_arity:dac(2)");
    CHECK(build({"dac", "8", "1"}, err).empty());
    CHECK(err == "bad_value:channel(0..7)");
    CHECK(build({"dac", "1", "65536"}, err).empty());
    CHECK(err == "bad_value:value(0..65535)");
    CHECK(build({"table", "4", "0", "0"}, err).empty());
    CHECK(err == "bad_value:table(0..3)");
    CHECK(build({"gpio", "8", "on"}, err).empty());
    CHECK(err == "bad_value:pin(0..7)");
    CHECK(build({"gpio", "1", "maybe"}, err).empty());
    CHECK(err == "bad_value:state(on|off)");
    CHECK(build({"rs422", "0"}, err).empty());
}
