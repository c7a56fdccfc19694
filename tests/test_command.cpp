#include <doctest/doctest.h>
#include <cstring>
#include "dacwire/command.hpp"

using namespace dacwire;

static bool frame_is(const Command& c, uint8_t b0, uint8_t b1, uint8_t b2, uint8_t b3) {
    Frame f = encode(c);
    return f[0] == b0 && f[1] == b1 && f[2] == b2 && f[3] == b3;
}

TEST_CASE("DAC write encodes channel, zero sub-command and big-endian value") {
    Command c;
    REQUIRE(make_dac_write(3, 0x1000, c));
    CHECK(frame_is(c, 0x03, 0x00, 0x10, 0x00));

    REQUIRE(make_dac_write(7, 0xFFFF, c));
    CHECK(frame_is(c, 0x07, 0x00, 0xFF, 0xFF));
}

TEST_CASE("Builders reject out-of-range fields and leave the output untouched") {
    Command c = make_ldac();
    const Command before = c;

    CHECK_FALSE(make_dac_write(8, 1, c));
    CHECK_FALSE(make_attach_table(0, 4, c));
    CHECK_FALSE(make_attach_table(8, 0, c));
    CHECK_FALSE(make_table_write(4, 0, 0, c));
    CHECK_FALSE(make_gpio_set(8, true, c));
    CHECK(c == before);
}

TEST_CASE("Table operations use 16 + table on the wire") {
    Command c;
    REQUIRE(make_attach_table(2, 1, c));
    CHECK(frame_is(c, 0x02, 0x11, 0x00, 0x00));

    REQUIRE(make_table_write(1, 49, 0x4000, c));
    CHECK(frame_is(c, 0x11, 49, 0x40, 0x00));

    REQUIRE(make_table_write(3, 255, 0x0001, c));
    CHECK(frame_is(c, 0x13, 0xFF, 0x00, 0x01));
}

TEST_CASE("Special opcodes pad unused bytes with zero") {
    CHECK(frame_is(make_use_table_offset(48), 0xFF, 48, 0x00, 0x00));
    CHECK(frame_is(make_keepalive(),          0xFD, 0x00, 0x00, 0x00));
    CHECK(frame_is(make_ldac(),               0xFC, 0x00, 0x00, 0x00));
    CHECK(frame_is(make_register_write(2, 33920), 0xFB, 0x02, 0x84, 0x80));

    Command g;
    REQUIRE(make_gpio_set(1, true, g));
    CHECK(frame_is(g, 0xFE, 0x01, 0x00, 0x01));
    REQUIRE(make_gpio_set(1, false, g));
    CHECK(frame_is(g, 0xFE, 0x01, 0x00, 0x00));
}

TEST_CASE("Decoding an encoded frame gives the same command back") {
    Command cmds[8];
    REQUIRE(make_dac_write(5, 12345, cmds[0]));
    REQUIRE(make_attach_table(6, 3, cmds[1]));
    REQUIRE(make_table_write(0, 7, 0xBEEF, cmds[2]));
    cmds[3] = make_use_table_offset(9);
    REQUIRE(make_gpio_set(4, true, cmds[4]));
    cmds[5] = make_keepalive();
    cmds[6] = make_ldac();
    cmds[7] = make_register_write(1, 30);

    for (const auto& c : cmds) {
        Frame f = encode(c);
        Command back;
        REQUIRE(decode(f.data(), f.size(), back));
        CHECK(back == c);
    }
}

TEST_CASE("Decode rejects unknown opcodes, bad sub-commands and wrong lengths") {
    Command out;
    const uint8_t unknown[4]   = {0x08, 0x00, 0x00, 0x00};
    const uint8_t bad_sub[4]   = {0x02, 0x05, 0x00, 0x00};
    const uint8_t bad_table[4] = {0x02, 0x14, 0x00, 0x00};
    const uint8_t bad_pin[4]   = {0xFE, 0x08, 0x00, 0x01};
    const uint8_t op_fa[4]     = {0xFA, 0x00, 0x00, 0x00};

    CHECK_FALSE(decode(unknown, 4, out));
    CHECK_FALSE(decode(bad_sub, 4, out));
    CHECK_FALSE(decode(bad_table, 4, out));
    CHECK_FALSE(decode(bad_pin, 4, out));
    CHECK_FALSE(decode(op_fa, 4, out));
    CHECK_FALSE(decode(unknown, 3, out));
    CHECK_FALSE(decode(nullptr, 4, out));
}

TEST_CASE("Any non-zero GPIO value decodes as on") {
    const uint8_t f[4] = {0xFE, 0x02, 0x12, 0x34};
    Command c;
    REQUIRE(decode(f, 4, c));
    CHECK(c.kind == CommandKind::GpioSet);
    CHECK(c.pin == 2);
    CHECK(c.on);
}

TEST_CASE("Opcode of a command is its first frame byte") {
    Command c;
    REQUIRE(make_dac_write(4, 1, c));
    CHECK(opcode_of(c) == 4);
    REQUIRE(make_table_write(2, 0, 0, c));
    CHECK(opcode_of(c) == 18);
    CHECK(opcode_of(make_keepalive()) == OP_KEEPALIVE);
}

TEST_CASE("Labels read like the device log") {
    Command c;
    REQUIRE(make_dac_write(3, 4096, c));
    CHECK(std::strcmp(describe(c).c_str(), "DAC 3 = 4096") == 0);
    REQUIRE(make_gpio_set(1, true, c));
    CHECK(std::strcmp(describe(c).c_str(), "GPIO 1 = ON") == 0);
    REQUIRE(make_table_write(0, 49, 16384, c));
    CHECK(std::strcmp(describe(c).c_str(), "table 0[49] = 16384") == 0);
    CHECK(std::strcmp(describe(make_use_table_offset(5)).c_str(), "Table offset = 5") == 0);
    CHECK(std::strcmp(kind_name(CommandKind::AttachTable), "attach") == 0);
}

TEST_CASE("Responses are classified against the expected length") {
    const uint8_t ok[3] = {0x00, 0x00, 0x99};
    const uint8_t err[2] = {0xFF, 0xFF};

    ResponseView v = classify_response(ok, 0);
    CHECK(v.kind == ResponseKind::Empty);
    CHECK_FALSE(v.has_status);

    v = classify_response(ok, 1);
    CHECK(v.kind == ResponseKind::Partial);
    CHECK(v.count == 1);
    CHECK_FALSE(v.status_ok());

    v = classify_response(ok, 3);
    CHECK(v.kind == ResponseKind::Bytes);
    CHECK(v.status_ok());

    v = classify_response(err, 2);
    CHECK(v.kind == ResponseKind::Bytes);
    CHECK(v.has_status);
    CHECK(v.status == STATUS_ERROR);
    CHECK_FALSE(v.status_ok());

    v = classify_response(err, 2, 4);
    CHECK(v.kind == ResponseKind::Partial);
    CHECK(v.has_status);
}

TEST_CASE("Extended reply headers announce their payload length") {
    const uint8_t standard[2] = {0x00, 0x00};
    const uint8_t extended[2] = {0x01, 0x05};
    CHECK(reply_length_from_header(standard, 2) == 2);
    CHECK(reply_length_from_header(extended, 2) == 7);
    CHECK(reply_length_from_header(extended, 1) == 2);
}
