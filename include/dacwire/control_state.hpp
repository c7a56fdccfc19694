#pragma once
/**
 * @page dw-control-state dacwire Control State
 * @file control_state.hpp
 * @brief Bounded model of the controller's outputs plus the event-to-command mapping used by
 *        the interactive panel.
 *
 * @details
 * PURPOSE
 * -------
 * The panel (and any other interactive driver) never writes a DAC value straight from user
 * input. It turns a key into a ControlEvent, hands the event to apply_event(), and sends
 * whatever Command comes back. apply_event() is the only place the state changes, and it
 * clamps before it builds the Command, so an out-of-range value can never reach the codec.
 *
 * NUMERIC CONTRACT
 * ----------------
 *   increase(v, s)   = min(v + s, 65535)          saturating, never wraps
 *   decrease(v, s)   = v >= s ? v - s : 0         saturating, never underflows
 *   large_step(v)    = v == 65535 ? 0             wraps ONLY from exactly 65535
 *                                 : min(v + 8192, 65535)
 *
 * The large step is clamp-then-wrap: 65400 + 8192 clamps to 65535, and only the next press
 * wraps to 0. The same rule (with a different step) drives the scripted sweep.
 *
 * OWNERSHIP
 * ---------
 * ControlState is a plain struct owned by the event loop and passed by reference. There is
 * no global state; tests build a fresh one per case.
 *
 * EXAMPLE
 * -------
 * @code
 *   dacwire::ControlState st;
 *   dacwire::ControlEvent ev;
 *   dacwire::Command cmd;
 *   if (dacwire::key_to_event(key, ev) && dacwire::apply_event(st, ev, cmd))
 *       session.send(cmd);
 * @endcode
 */

#include <stdint.h>
#include "etl/array.h"
#include "dacwire/command.hpp"

namespace dacwire {

static constexpr uint16_t DAC_MAX      = 65535;
static constexpr uint16_t LARGE_STEP   = 8192;   ///< space bar
static constexpr uint16_t FINE_STEP    = 16;     ///< '=' / '-'
static constexpr uint16_t DEFAULT_STEP = 256;    ///< arrow keys
static constexpr uint8_t  MAX_TABLE_DIGIT = 9;   ///< panel offsets are single digits

// ---- saturating arithmetic (all total over uint16_t) ----
uint16_t saturating_increase(uint16_t v, uint16_t step);
uint16_t saturating_decrease(uint16_t v, uint16_t step);

/// min(v + step, 65535), except that exactly 65535 wraps to 0.
uint16_t clamp_or_wrap(uint16_t v, uint16_t step);

/// clamp_or_wrap(v, LARGE_STEP).
uint16_t large_step(uint16_t v);

/**
 * @enum EventKind
 * @brief Logical intents an interactive driver can produce.
 */
enum class EventKind : uint8_t {
    None,
    SelectLeft,
    SelectRight,
    Increase,        ///< by ControlState::step
    Decrease,        ///< by ControlState::step
    FineIncrease,    ///< by FINE_STEP
    FineDecrease,    ///< by FINE_STEP
    LargeStep,
    ToggleGpio,      ///< arg = pin
    SetTableOffset,  ///< arg = digit 0..9
    Quit
};

struct ControlEvent {
    EventKind kind{EventKind::None};
    uint8_t   arg{0};
};

/**
 * @struct ControlState
 * @brief Everything the panel shows and mutates.
 *
 * Starts with all DACs at 0, all GPIO off, table offset 0, channel 0 selected.
 */
struct ControlState {
    etl::array<uint16_t, DAC_CHANNELS> dac;
    etl::array<bool, GPIO_PINS>        gpio;
    uint8_t      table_offset{0};
    uint8_t      selected_channel{0};
    uint16_t     step{DEFAULT_STEP};
    uint32_t     keepalive_count{0};
    CommandLabel last_command;
    bool         quit_requested{false};

    ControlState() {
        dac.fill(0);
        gpio.fill(false);
    }
};

/**
 * @brief Apply one event and produce the Command that reflects it.
 *
 * @param st   state to mutate
 * @param ev   event to apply
 * @param out  receives the Command to send
 * @return true when @p out holds a Command to send. Selection changes, Quit, None and
 *         out-of-range arguments (pin > 7, digit > 9) return false and send nothing.
 *
 * Also updates st.last_command with describe(out).
 */
bool apply_event(ControlState& st, const ControlEvent& ev, Command& out);

/// Count a keepalive about to be sent and return it; updates last_command.
Command note_keepalive(ControlState& st);

// ---- keyboard mapping ----
// Printable keys use their ASCII code. Arrow keys are decoded by the terminal layer into
// these private codes above the byte range.
enum : int {
    KEY_CTRL_C = 3,       ///< raw mode delivers Ctrl-C as a byte, not SIGINT
    KEY_ESC    = 27,
    KEY_UP     = 0x1001,
    KEY_DOWN   = 0x1002,
    KEY_LEFT   = 0x1003,
    KEY_RIGHT  = 0x1004
};

/**
 * @brief Map a key code to an event.
 *
 *   Left/Right  select channel         Up/Down  +/- step
 *   '=' / '-'   +/- FINE_STEP          space    large step
 *   '0'..'9'    table offset           z x c v b n m ,  toggle GPIO 0..7
 *   'q', Esc, Ctrl-C  quit
 *
 * @return false for keys with no binding.
 */
bool key_to_event(int key, ControlEvent& out);

} // namespace dacwire
