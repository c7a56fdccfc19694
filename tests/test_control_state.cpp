#include <doctest/doctest.h>
#include "dacwire/control_state.hpp"

using namespace dacwire;

static ControlEvent ev(EventKind k, uint8_t arg = 0) {
    ControlEvent e;
    e.kind = k;
    e.arg = arg;
    return e;
}

TEST_CASE("Saturating arithmetic never wraps") {
    CHECK(saturating_increase(65000, 1000) == 65535);
    CHECK(saturating_increase(65535, 1) == 65535);
    CHECK(saturating_increase(100, 256) == 356);
    CHECK(saturating_decrease(100, 256) == 0);
    CHECK(saturating_decrease(0, 1) == 0);
    CHECK(saturating_decrease(300, 256) == 44);
}

TEST_CASE("Large step clamps first and wraps only from exactly 65535") {
    CHECK(large_step(0) == 8192);
    CHECK(large_step(57344) == 65535);
    CHECK(large_step(61440) == 65535);
    CHECK(large_step(65400) == 65535);
    CHECK(large_step(65535) == 0);
    CHECK(clamp_or_wrap(65024, 511) == 65535);
    CHECK(clamp_or_wrap(65535, 511) == 0);
}

TEST_CASE("Eight space presses walk a channel up to full scale and back to zero") {
    ControlState st;
    Command c;
    const uint16_t expect[9] = {8192, 16384, 24576, 32768, 40960, 49152, 57344, 65535, 0};
    for (int i = 0; i < 9; ++i) {
        REQUIRE(apply_event(st, ev(EventKind::LargeStep), c));
        CHECK(st.dac[0] == expect[i]);
        CHECK(c.kind == CommandKind::DacWrite);
        CHECK(c.value == expect[i]);
    }
}

TEST_CASE("Up with a step of 8192 reaches full scale on the eighth press and stays there") {
    ControlState st;
    st.step = 8192;
    Command c;
    for (int i = 1; i <= 7; ++i) {
        REQUIRE(apply_event(st, ev(EventKind::Increase), c));
        CHECK(st.dac[0] == 8192 * i);
    }
    REQUIRE(apply_event(st, ev(EventKind::Increase), c));
    CHECK(st.dac[0] == 65535);
    REQUIRE(apply_event(st, ev(EventKind::Increase), c));
    CHECK(st.dac[0] == 65535);
    CHECK(c.value == 65535);
}

TEST_CASE("Step arithmetic holds for every 16-bit value") {
    const uint16_t steps[] = {1, 16, 256, 511, 8192, 65535};
    for (uint32_t v = 0; v <= 0xFFFF; ++v) {
        const uint16_t x = static_cast<uint16_t>(v);
        for (uint16_t s : steps) {
            const uint32_t up = v + s;
            if (saturating_increase(x, s) != (up > 65535 ? 65535 : up)) FAIL_CHECK("increase v=" << v << " step=" << s);
            if (saturating_decrease(x, s) != (v >= s ? v - s : 0)) FAIL_CHECK("decrease v=" << v << " step=" << s);
        }
        const uint32_t big = v + 8192;
        const uint32_t want = v == 65535 ? 0 : (big > 65535 ? 65535 : big);
        if (large_step(x) != want) FAIL_CHECK("large_step v=" << v);
    }
}

TEST_CASE("Channel selection wraps and sends nothing") {
    ControlState st;
    Command c;
    CHECK_FALSE(apply_event(st, ev(EventKind::SelectLeft), c));
    CHECK(st.selected_channel == 7);
    CHECK_FALSE(apply_event(st, ev(EventKind::SelectRight), c));
    CHECK(st.selected_channel == 0);
}

TEST_CASE("Up and down use the configured step on the selected channel only") {
    ControlState st;
    st.selected_channel = 2;
    st.step = 1000;
    Command c;

    REQUIRE(apply_event(st, ev(EventKind::Increase), c));
    CHECK(c.channel == 2);
    CHECK(c.value == 1000);
    CHECK(st.dac[1] == 0);

    REQUIRE(apply_event(st, ev(EventKind::FineIncrease), c));
    CHECK(st.dac[2] == 1016);
    REQUIRE(apply_event(st, ev(EventKind::FineDecrease), c));
    REQUIRE(apply_event(st, ev(EventKind::Decrease), c));
    REQUIRE(apply_event(st, ev(EventKind::Decrease), c));
    CHECK(st.dac[2] == 0);
}

TEST_CASE("GPIO toggles flip state and build the matching command") {
    ControlState st;
    Command c;
    REQUIRE(apply_event(st, ev(EventKind::ToggleGpio, 3), c));
    CHECK(st.gpio[3]);
    CHECK(c.kind == CommandKind::GpioSet);
    CHECK(c.on);
    REQUIRE(apply_event(st, ev(EventKind::ToggleGpio, 3), c));
    CHECK_FALSE(st.gpio[3]);
    CHECK_FALSE(c.on);

    CHECK_FALSE(apply_event(st, ev(EventKind::ToggleGpio, 8), c));
}

TEST_CASE("Table offset accepts digits only") {
    ControlState st;
    Command c;
    REQUIRE(apply_event(st, ev(EventKind::SetTableOffset, 9), c));
    CHECK(st.table_offset == 9);
    CHECK(c.kind == CommandKind::UseTableOffset);
    CHECK_FALSE(apply_event(st, ev(EventKind::SetTableOffset, 10), c));
    CHECK(st.table_offset == 9);
}

TEST_CASE("Quit sets the flag and the last command label follows what was sent") {
    ControlState st;
    Command c;
    CHECK_FALSE(apply_event(st, ev(EventKind::Quit), c));
    CHECK(st.quit_requested);

    Command ka = note_keepalive(st);
    CHECK(ka.kind == CommandKind::KeepAlive);
    CHECK(st.keepalive_count == 1);
    CHECK(st.last_command == "keepalive");
}

TEST_CASE("Keys map to events") {
    ControlEvent e;
    REQUIRE(key_to_event(KEY_UP, e));
    CHECK(e.kind == EventKind::Increase);
    REQUIRE(key_to_event(' ', e));
    CHECK(e.kind == EventKind::LargeStep);
    REQUIRE(key_to_event('7', e));
    CHECK(e.kind == EventKind::SetTableOffset);
    CHECK(e.arg == 7);
    REQUIRE(key_to_event(',', e));
    CHECK(e.kind == EventKind::ToggleGpio);
    CHECK(e.arg == 7);
    REQUIRE(key_to_event(KEY_ESC, e));
    CHECK(e.kind == EventKind::Quit);
    REQUIRE(key_to_event(0x03, e));
    CHECK(e.kind == EventKind::Quit);
    CHECK_FALSE(key_to_event('k', e));
}
