#include "dacwire/control_state.hpp"

namespace dacwire {

// ---- arithmetic ----
// Widen to 32 bits so the sums below cannot overflow.

uint16_t saturating_increase(uint16_t v, uint16_t step) {
    uint32_t s = static_cast<uint32_t>(v) + step;
    return s > DAC_MAX ? DAC_MAX : static_cast<uint16_t>(s);
}

uint16_t saturating_decrease(uint16_t v, uint16_t step) {
    return v >= step ? static_cast<uint16_t>(v - step) : 0;
}

uint16_t clamp_or_wrap(uint16_t v, uint16_t step) {
    if (v == DAC_MAX) return 0;
    return saturating_increase(v, step);
}

uint16_t large_step(uint16_t v) {
    return clamp_or_wrap(v, LARGE_STEP);
}


// ---- events ----

// Write the (already clamped) value of the selected channel.
static bool emit_selected(ControlState& st, Command& out) {
    return make_dac_write(st.selected_channel, st.dac[st.selected_channel], out);
}

bool apply_event(ControlState& st, const ControlEvent& ev, Command& out) {
    uint8_t ch = static_cast<uint8_t>(st.selected_channel % DAC_CHANNELS);
    st.selected_channel = ch;

    bool produced = false;
    switch (ev.kind) {
        case EventKind::SelectLeft:
            st.selected_channel = static_cast<uint8_t>((ch + DAC_CHANNELS - 1) % DAC_CHANNELS);
            return false;
        case EventKind::SelectRight:
            st.selected_channel = static_cast<uint8_t>((ch + 1) % DAC_CHANNELS);
            return false;

        case EventKind::Increase:
            st.dac[ch] = saturating_increase(st.dac[ch], st.step);
            produced = emit_selected(st, out);
            break;
        case EventKind::Decrease:
            st.dac[ch] = saturating_decrease(st.dac[ch], st.step);
            produced = emit_selected(st, out);
            break;
        case EventKind::FineIncrease:
            st.dac[ch] = saturating_increase(st.dac[ch], FINE_STEP);
            produced = emit_selected(st, out);
            break;
        case EventKind::FineDecrease:
            st.dac[ch] = saturating_decrease(st.dac[ch], FINE_STEP);
            produced = emit_selected(st, out);
            break;
        case EventKind::LargeStep:
            st.dac[ch] = large_step(st.dac[ch]);
            produced = emit_selected(st, out);
            break;

        case EventKind::ToggleGpio:
            if (ev.arg >= GPIO_PINS) return false;
            st.gpio[ev.arg] = !st.gpio[ev.arg];
            produced = make_gpio_set(ev.arg, st.gpio[ev.arg], out);
            break;

        case EventKind::SetTableOffset:
            if (ev.arg > MAX_TABLE_DIGIT) return false;
            st.table_offset = ev.arg;
            out = make_use_table_offset(st.table_offset);
            produced = true;
            break;

        case EventKind::Quit:
            st.quit_requested = true;
            return false;

        case EventKind::None:
            return false;
    }

    if (produced) st.last_command = describe(out);
    return produced;
}

Command note_keepalive(ControlState& st) {
    ++st.keepalive_count;
    Command c = make_keepalive();
    st.last_command = describe(c);
    return c;
}


// ---- keys ----

bool key_to_event(int key, ControlEvent& out) {
    static const char GPIO_KEYS[GPIO_PINS] = {'z', 'x', 'c', 'v', 'b', 'n', 'm', ','};

    ControlEvent ev;
    switch (key) {
        case KEY_LEFT:  ev.kind = EventKind::SelectLeft;   break;
        case KEY_RIGHT: ev.kind = EventKind::SelectRight;  break;
        case KEY_UP:    ev.kind = EventKind::Increase;     break;
        case KEY_DOWN:  ev.kind = EventKind::Decrease;     break;
        case '=':       ev.kind = EventKind::FineIncrease; break;
        case '-':       ev.kind = EventKind::FineDecrease; break;
        case ' ':       ev.kind = EventKind::LargeStep;    break;
        case 'q':
        case KEY_CTRL_C:
        case KEY_ESC:   ev.kind = EventKind::Quit;         break;
        default:
            if (key >= '0' && key <= '9') {
                ev.kind = EventKind::SetTableOffset;
                ev.arg  = static_cast<uint8_t>(key - '0');
                break;
            }
            for (uint8_t pin = 0; pin < GPIO_PINS; ++pin) {
                if (key == GPIO_KEYS[pin]) {
                    ev.kind = EventKind::ToggleGpio;
                    ev.arg  = pin;
                    break;
                }
            }
            if (ev.kind == EventKind::None) return false;
            break;
    }
    out = ev;
    return true;
}

} // namespace dacwire
