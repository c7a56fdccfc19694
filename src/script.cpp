#include "dacwire/script.hpp"
#include "dacwire/control_state.hpp"   // clamp_or_wrap, DAC_MAX

namespace dacwire {

static bool push(etl::ivector<Command>& out, const Command& c) {
    if (out.full()) return false;
    out.push_back(c);
    return true;
}

// ---- init sequence ----

bool build_gpio_enable(etl::ivector<Command>& out) {
    Command c;
    for (uint8_t pin = 0; pin < 2; ++pin) {
        if (!make_gpio_set(pin, true, c) || !push(out, c)) return false;
    }
    return true;
}

bool build_init_tables(etl::ivector<Command>& out) {
    static const uint16_t TABLE0[3] = {0x0000, 0x4000, 0x8000};
    static const uint16_t TABLE1[3] = {0x4000, 0x8000, 0x0000};

    Command c;
    for (uint8_t i = 0; i < 3; ++i) {
        if (!make_table_write(0, static_cast<uint8_t>(INIT_TABLE_FIRST + i), TABLE0[i], c) || !push(out, c))
            return false;
    }
    for (uint8_t i = 0; i < 3; ++i) {
        if (!make_table_write(1, static_cast<uint8_t>(INIT_TABLE_FIRST + i), TABLE1[i], c) || !push(out, c))
            return false;
    }
    return true;
}

bool build_bind_channels(etl::ivector<Command>& out) {
    Command c;
    for (uint8_t ch = 0; ch < DAC_CHANNELS; ++ch) {
        if (!make_attach_table(ch, static_cast<uint8_t>(ch % 2), c) || !push(out, c)) return false;
    }
    return true;
}

bool build_init_sequence(etl::ivector<Command>& out) {
    if (!build_gpio_enable(out))   return false;
    if (!build_init_tables(out))   return false;
    if (!build_bind_channels(out)) return false;
    for (uint8_t i = 0; i < INIT_KEEPALIVES; ++i) {
        if (!push(out, make_keepalive())) return false;
    }
    return true;
}

// ---- demo pieces ----

bool build_all_channels(uint16_t value, etl::ivector<Command>& out) {
    Command c;
    for (uint8_t ch = 0; ch < DAC_CHANNELS; ++ch) {
        if (!make_dac_write(ch, value, c) || !push(out, c)) return false;
    }
    return true;
}

bool build_demo_bindings(etl::ivector<Command>& out) {
    Command c;
    for (uint8_t ch = 0; ch < DAC_CHANNELS; ++ch) {
        uint8_t table = static_cast<uint8_t>((ch / 2) % 2);   // pairs alternate 0,1,0,1
        if (!make_attach_table(ch, table, c) || !push(out, c)) return false;
    }
    return true;
}

bool build_table_fill(uint8_t table, uint8_t first_index, uint8_t count, uint16_t step,
                      bool ascending, etl::ivector<Command>& out) {
    if (table >= TABLE_COUNT) return false;
    if (static_cast<uint16_t>(first_index) + count > 256) return false;

    uint16_t v = ascending ? 0x0000 : 0xFFFF;
    Command c;
    for (uint8_t i = 0; i < count; ++i) {
        if (!make_table_write(table, static_cast<uint8_t>(first_index + i), v, c) || !push(out, c))
            return false;
        v = ascending ? static_cast<uint16_t>(v + step) : static_cast<uint16_t>(v - step);
    }
    return true;
}

bool build_rs422_config(uint32_t speed, etl::ivector<Command>& out) {
    if (!push(out, make_register_write(RS422_REG_HIGH, static_cast<uint16_t>(speed >> 16)))) return false;
    return push(out, make_register_write(RS422_REG_LOW, static_cast<uint16_t>(speed & 0xFFFF)));
}

// ---- sweep ----

Command SweepGenerator::next() {
    channel_ = static_cast<uint8_t>((channel_ + 1) % DAC_CHANNELS);
    value_   = clamp_or_wrap(value_, SWEEP_STEP);
    ++count_;

    uint16_t out_value = channel_ < 4 ? value_ : static_cast<uint16_t>(DAC_MAX - value_);
    // channel_ < DAC_CHANNELS by the modulo above, so the builder's range check is not needed.
    Command c;
    c.kind    = CommandKind::DacWrite;
    c.channel = channel_;
    c.value   = out_value;
    return c;
}

} // namespace dacwire
