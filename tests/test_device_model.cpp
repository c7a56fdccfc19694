#include <doctest/doctest.h>
#include "dacwire/device_model.hpp"

using namespace dacwire;

TEST_CASE("Device model mirrors every documented command") {
    DeviceModel dev;
    Command c;

    REQUIRE(make_dac_write(2, 0x1234, c));
    CHECK(dev.apply(c) == STATUS_OK);
    REQUIRE(make_attach_table(2, 3, c));
    dev.apply(c);
    REQUIRE(make_table_write(3, 10, 0xAAAA, c));
    dev.apply(c);
    REQUIRE(make_gpio_set(6, true, c));
    dev.apply(c);
    dev.apply(make_use_table_offset(57));
    dev.apply(make_keepalive());
    dev.apply(make_ldac());
    dev.apply(make_register_write(1, 30));

    CHECK(dev.dac(2) == 0x1234);
    CHECK(dev.binding(2) == 3);
    CHECK(dev.binding(0) == NO_TABLE);
    CHECK(dev.table(3, 10) == 0xAAAA);
    CHECK(dev.gpio(6));
    CHECK(dev.table_offset() == 57);
    CHECK(dev.keepalives() == 1);
    CHECK(dev.ldac_count() == 1);
    CHECK(dev.reg(1) == 30);
    CHECK(dev.frames_ok() == 8);
    CHECK(dev.last() == make_register_write(1, 30));
}

TEST_CASE("Undecodable frames answer STATUS_ERROR and change nothing") {
    DeviceModel dev;
    const uint8_t bad[4] = {0x09, 0x00, 0x12, 0x34};
    CHECK(dev.apply(bad, 4) == STATUS_ERROR);
    CHECK(dev.frames_error() == 1);
    CHECK(dev.frames_ok() == 0);

    uint8_t sb[2];
    DeviceModel::status_bytes(STATUS_ERROR, sb);
    CHECK(sb[0] == 0xFF);
    CHECK(sb[1] == 0xFF);
}

TEST_CASE("Frame assembler cuts a stream into 4-byte frames") {
    FrameAssembler fa;
    const uint8_t stream[6] = {0xFD, 0x00, 0x00, 0x00, 0x03, 0x00};
    int frames = 0;
    for (uint8_t b : stream) if (fa.push(b)) ++frames;
    CHECK(frames == 1);
    CHECK(fa.pending() == 2);
    CHECK(fa.push(0x10) == false);
    CHECK(fa.push(0x00) == true);
    CHECK(fa.frame()[0] == 0x03);
    CHECK(fa.frame()[2] == 0x10);
}
