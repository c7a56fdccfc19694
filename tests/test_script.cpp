#include <doctest/doctest.h>
#include "etl/vector.h"
#include "dacwire/script.hpp"

using namespace dacwire;

TEST_CASE("Init sequence: GPIO, seeded tables, even/odd binding, three keepalives") {
    etl::vector<Command, 32> seq;
    REQUIRE(build_init_sequence(seq));
    REQUIRE(seq.size() == 2 + 6 + 8 + 3);

    CHECK(seq[0].kind == CommandKind::GpioSet);
    CHECK(seq[0].pin == 0);
    CHECK(seq[1].pin == 1);
    CHECK(seq[1].on);

    CHECK(seq[2].table == 0);
    CHECK(seq[2].index == 49);
    CHECK(seq[2].value == 0x0000);
    CHECK(seq[4].index == 51);
    CHECK(seq[4].value == 0x8000);
    CHECK(seq[5].table == 1);
    CHECK(seq[5].value == 0x4000);
    CHECK(seq[7].value == 0x0000);

    for (uint8_t ch = 0; ch < DAC_CHANNELS; ++ch) {
        const Command& b = seq[8 + ch];
        CHECK(b.kind == CommandKind::AttachTable);
        CHECK(b.channel == ch);
        CHECK(b.table == ch % 2);
    }
    for (size_t i = 16; i < seq.size(); ++i) CHECK(seq[i].kind == CommandKind::KeepAlive);
}

TEST_CASE("Builders stop when the output vector is full") {
    etl::vector<Command, 4> small;
    CHECK_FALSE(build_init_sequence(small));
    CHECK(small.size() == 4);
}

TEST_CASE("Sweep starts at channel 1 and mirrors the upper channels") {
    SweepGenerator gen;
    Command c = gen.next();
    CHECK(c.channel == 1);
    CHECK(c.value == 511);

    for (int i = 0; i < 3; ++i) c = gen.next();
    CHECK(c.channel == 4);
    CHECK(gen.value() == 4 * 511);
    CHECK(c.value == 65535 - 4 * 511);

    for (int i = 0; i < 4; ++i) c = gen.next();
    CHECK(c.channel == 0);
    CHECK(gen.count() == 8);
}

TEST_CASE("Sweep value clamps at full scale and only then wraps") {
    SweepGenerator gen;
    // 128 steps of 511 reach 65408; the next one clamps, the one after wraps.
    for (int i = 0; i < 128; ++i) gen.next();
    CHECK(gen.value() == 65408);
    gen.next();
    CHECK(gen.value() == 65535);
    gen.next();
    CHECK(gen.value() == 0);
}

TEST_CASE("Demo bindings pair channels onto tables 0 and 1") {
    etl::vector<Command, 8> seq;
    REQUIRE(build_demo_bindings(seq));
    const uint8_t expect[8] = {0, 0, 1, 1, 0, 0, 1, 1};
    for (uint8_t ch = 0; ch < 8; ++ch) CHECK(seq[ch].table == expect[ch]);
}

TEST_CASE("Table fills step up from 0 or down from 0xFFFF with 16-bit wrap") {
    etl::vector<Command, 20> seq;
    REQUIRE(build_table_fill(0, DEMO_OFFSET_BASE, DEMO_TABLE_LEN, DEMO_TABLE_STEP, true, seq));
    REQUIRE(build_table_fill(1, DEMO_OFFSET_BASE, DEMO_TABLE_LEN, DEMO_TABLE_STEP, false, seq));
    REQUIRE(seq.size() == 20);

    CHECK(seq[0].index == 48);
    CHECK(seq[0].value == 0x0000);
    CHECK(seq[1].value == 0x3FFF);
    CHECK(seq[4].value == 0xFFFC);
    CHECK(seq[5].value == 0x3FFB);    // wrapped
    CHECK(seq[9].index == 57);

    CHECK(seq[10].table == 1);
    CHECK(seq[10].value == 0xFFFF);
    CHECK(seq[11].value == 0xC000);
    CHECK(seq[15].value == 0xC004);   // wrapped
}

TEST_CASE("Table fill refuses ranges past entry 255 and bad tables") {
    etl::vector<Command, 20> seq;
    CHECK_FALSE(build_table_fill(0, 250, 10, 1, true, seq));
    CHECK_FALSE(build_table_fill(4, 0, 1, 1, true, seq));
    CHECK(seq.empty());
    CHECK(build_table_fill(0, 246, 10, 1, true, seq));
}

TEST_CASE("RS-422 speed splits into high and low register words") {
    etl::vector<Command, 2> seq;
    REQUIRE(build_rs422_config(2000000, seq));
    CHECK(seq[0].kind == CommandKind::RegisterWrite);
    CHECK(seq[0].reg == 1);
    CHECK(seq[0].value == 30);
    CHECK(seq[1].reg == 2);
    CHECK(seq[1].value == 33920);
}
