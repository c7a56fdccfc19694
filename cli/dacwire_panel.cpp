/**
 * @file dacwire_panel.cpp
 * @brief dacwire-panel: keyboard control of the eight DAC channels, GPIO and table offset.
 *
 * Keys:
 *   Left/Right  select channel       Up/Down  +/- step (--step, default 256)
 *   '=' / '-'   +/- 16               space    +8192, wraps to 0 only from 65535
 *   0..9        table offset         z x c v b n m ,  toggle GPIO 0..7
 *   q / Esc / Ctrl-C  quit
 *
 * Every key goes through key_to_event() and apply_event(); the panel only sends what comes
 * back. Keepalives follow the session clock while the panel waits for keys. On exit every
 * GPIO pin the panel switched on is cleared again.
 */

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include "CLI/CLI.hpp"

#include "dacwire/control_state.hpp"
#include "fd_io.hpp"
#include "tool_common.hpp"

using namespace dacwire;

static constexpr int KEY_POLL_MS = 50;
static constexpr int ESC_FOLLOW_MS = 30;   // time allowed for the rest of an arrow sequence

// ---------- terminal ----------

// Puts stdin in raw mode for its lifetime.
class RawTerminal {
public:
    RawTerminal() {
        if (!::isatty(STDIN_FILENO)) return;
        if (::tcgetattr(STDIN_FILENO, &saved_) != 0) return;
        termios raw = saved_;
        ::cfmakeraw(&raw);
        raw.c_oflag |= OPOST;          // keep "\n" -> "\r\n" for the redraw
        raw.c_cc[VMIN]  = 0;
        raw.c_cc[VTIME] = 0;
        active_ = ::tcsetattr(STDIN_FILENO, TCSANOW, &raw) == 0;
    }
    ~RawTerminal() {
        if (active_) ::tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
    }
    RawTerminal(const RawTerminal&) = delete;
    RawTerminal& operator=(const RawTerminal&) = delete;

    bool active() const { return active_; }

private:
    termios saved_{};
    bool    active_{false};
};

static int read_byte(int timeout_ms) {
    pollfd p{STDIN_FILENO, POLLIN, 0};
    if (::poll(&p, 1, timeout_ms) <= 0) return -1;
    unsigned char c = 0;
    if (::read(STDIN_FILENO, &c, 1) != 1) return -1;
    return c;
}

// One key, with ESC [ A..D folded into KEY_UP..KEY_LEFT. Returns -1 when nothing arrived.
static int read_key(int timeout_ms) {
    int c = read_byte(timeout_ms);
    if (c != KEY_ESC) return c;

    int c1 = read_byte(ESC_FOLLOW_MS);
    if (c1 < 0) return KEY_ESC;
    if (c1 != '[' && c1 != 'O') return KEY_ESC;
    switch (read_byte(ESC_FOLLOW_MS)) {
        case 'A': return KEY_UP;
        case 'B': return KEY_DOWN;
        case 'C': return KEY_RIGHT;
        case 'D': return KEY_LEFT;
        default:  return -1;
    }
}

// ---------- drawing ----------

static void redraw(const ControlState& st, const Session& s, const std::string& target, const Ansi& a) {
    std::ostringstream o;
    o << "\033[H\033[2J";
    o << a.bold("dacwire panel") << "  " << target << " via " << s.link_name() << "\n\n";

    for (uint8_t ch = 0; ch < DAC_CHANNELS; ++ch) {
        std::string line = "  DAC " + std::to_string(ch) + "  " + std::to_string(st.dac[ch]);
        line += std::string(line.size() < 16 ? 16 - line.size() : 1, ' ') + hex16(st.dac[ch]);
        if (ch == st.selected_channel) o << a.cyan("> " + line.substr(2)) << "\n";
        else                           o << line << "\n";
    }

    o << "\n  GPIO  ";
    for (uint8_t p = 0; p < GPIO_PINS; ++p)
        o << (st.gpio[p] ? a.green(std::to_string(p)) : a.dim(std::to_string(p))) << " ";
    o << "\n  table offset " << unsigned(st.table_offset)
      << "   step " << st.step
      << "   keepalives " << st.keepalive_count << "\n";
    o << "  last: " << st.last_command.c_str() << "\n";

    const SessionStats& stats = s.stats();
    o << a.dim("  sent " + std::to_string(stats.commands_sent) +
               "  replies " + std::to_string(stats.responses_received) +
               "  timeouts " + std::to_string(stats.timeouts)) << "\n\n";
    o << a.dim("  arrows select/adjust  = - fine  space +8192  0-9 offset  zxcvbnm, gpio  q quit") << "\n";

    std::cout << o.str() << std::flush;
}

int main(int argc, char** argv) {
    ToolConfig cfg;
    std::string cfg_err;
    if (!preload_config(argc, argv, cfg, cfg_err)) return report_usage(cfg_err);

    CLI::App app{"dacwire-panel: interactive DAC/GPIO control"};

    std::string target;
    CommonOptions common;
    add_common_options(app, cfg, common);
    app.add_option("target", target, "Serial path or TCP address (host:port, [v6]:port)");

    CLI11_PARSE(app, argc, argv);

    if (common.dump_config) {
        std::cout << config_to_json(cfg).dump(2) << "\n";
        return EXIT_OK;
    }
    if (target.empty()) return report_usage("missing_target");
    if (!::isatty(STDIN_FILENO)) return report_usage("stdin_not_a_terminal");

    install_signal_handlers();
    const Ansi ansi{use_color(cfg)};
    // Debug lines would scroll the panel away; they go to stderr instead.
    Logger log(cfg.verbose, ansi.enabled, std::cerr, std::cerr);

    std::unique_ptr<Session> session;
    Error err;
    if (!connect_session(target, cfg, {}, log, session, err)) return report_error(err);

    ControlState st;
    st.step = cfg.step;
    session->start_clock(now_ms_steady32());

    bool link_lost = false;
    {
        RawTerminal term;
        if (!term.active()) {
            session->close();
            return report_usage("raw_mode_failed");
        }

        redraw(st, *session, target, ansi);
        while (!st.quit_requested && !stop_requested()) {
            bool dirty = false;

            const int key = read_key(KEY_POLL_MS);
            ControlEvent ev;
            Command cmd;
            if (key >= 0 && key_to_event(key, ev)) {
                if (apply_event(st, ev, cmd)) {
                    SendResult r = session->send(cmd);
                    if (r.failed()) { err = r.error; link_lost = true; break; }
                }
                dirty = true;
            }

            const uint32_t now = now_ms_steady32();
            if (session->clock().due(now)) {
                // Count it before sending so the label shows what went out.
                Command ka = note_keepalive(st);
                SendResult r = session->send(ka);
                if (r.failed()) { err = r.error; link_lost = true; break; }
                if (r.frame_written()) session->clock().reset(now);
                dirty = true;
            }

            if (dirty) redraw(st, *session, target, ansi);
        }
    }   // terminal restored here

    std::cout << "\n";
    if (link_lost) return report_error(err);

    std::vector<uint8_t> pins;
    for (uint8_t p = 0; p < GPIO_PINS; ++p)
        if (st.gpio[p]) pins.push_back(p);
    if (!session->shutdown(pins)) log.warn("some GPIO pins may still be on");
    return EXIT_OK;
}
