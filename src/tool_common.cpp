// ============================================================================
// tool_common.cpp - implementation for tool_common.hpp
// ============================================================================

#include "tool_common.hpp"
#include "transport_factory.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <thread>

namespace dacwire {

// ---------- options ----------

void add_common_options(CLI::App& app, ToolConfig& cfg, CommonOptions& common) {
    app.add_option("--config", common.config_path, "JSON config file (command-line options override it)");
    app.add_flag("--dump-config", common.dump_config, "Print the effective configuration as JSON and exit");

    app.add_option("--rate", cfg.rate_hz, "Scripted loop rate in Hz (0 = unpaced)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--read-timeout", cfg.read_timeout_ms, "Read timeout in ms (0 = serial 100, TCP 200)")
        ->check(CLI::Range(0u, 600000u));
    app.add_option("--write-timeout", cfg.write_timeout_ms, "Write timeout in ms")
        ->check(CLI::Range(1u, 600000u));
    app.add_option("--connect-timeout", cfg.connect_timeout_ms, "TCP connect timeout in ms")
        ->check(CLI::Range(1u, 600000u));
    app.add_option("--keepalive-interval", cfg.keepalive_interval_s, "Keepalive interval in seconds (0 = off)")
        ->check(CLI::Range(0.0, MAX_KEEPALIVE_INTERVAL_S));
    app.add_option("--step", cfg.step, "DAC step for up/down")
        ->check(CLI::Range(1, 65535));
    app.add_flag("-v,--verbose", cfg.verbose, "Log every frame, reply and soft timeout");
    app.add_flag("--no-responses", cfg.no_responses, "Fire-and-forget: never read replies");
    app.add_option("--response-commands", cfg.response_commands,
                   "Read replies only after these opcodes, e.g. \"0xfe,0xfd\" (or \"all\")");
    app.add_option("--command-delay", cfg.command_delay_ms, "Pause between a write and its read, in ms")
        ->check(CLI::Range(0u, 60000u));
    app.add_option("--duration", cfg.duration_s, "Stop after this many seconds (0 = until interrupted)")
        ->check(CLI::Range(0.0, MAX_DURATION_S));
    app.add_flag("--no-color", cfg.no_color, "Disable ANSI colours");
    app.add_option("--baud", cfg.baud, "Serial baud rate");
    app.add_option("--boot-delay", cfg.boot_delay_ms, "Delay after opening a serial port, in ms")
        ->check(CLI::Range(0, 10000));
}

bool preload_config(int argc, char** argv, ToolConfig& cfg, std::string& err) {
    static const char FLAG[] = "--config";
    const size_t flag_len = sizeof(FLAG) - 1;

    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        if (std::strcmp(a, FLAG) == 0) {
            if (i + 1 >= argc) { err = "bad_config:missing_path"; return false; }
            return load_config_file(argv[i + 1], cfg, err);
        }
        if (std::strncmp(a, FLAG, flag_len) == 0 && a[flag_len] == '=') {
            return load_config_file(a + flag_len + 1, cfg, err);
        }
    }
    return true;
}

bool use_color(const ToolConfig& cfg) {
    return !cfg.no_color && stdout_is_tty();
}


// ---------- interrupt handling ----------

static volatile std::sig_atomic_t g_stop = 0;

static void on_signal(int) { g_stop = 1; }

void install_signal_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;                   // no SA_RESTART: let poll() return EINTR promptly
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    struct sigaction ign;
    std::memset(&ign, 0, sizeof(ign));
    ign.sa_handler = SIG_IGN;
    sigemptyset(&ign.sa_mask);
    sigaction(SIGPIPE, &ign, nullptr);
}

bool stop_requested() { return g_stop != 0; }
void request_stop()   { g_stop = 1; }

void sleep_ms(uint32_t ms) {
    const uint32_t slice = 50;
    while (ms > 0 && !stop_requested()) {
        uint32_t d = std::min(ms, slice);
        std::this_thread::sleep_for(std::chrono::milliseconds(d));
        ms -= d;
    }
}


// ---------- connect ----------

bool connect_session(const std::string& target_text, const ToolConfig& cfg,
                     const std::vector<uint8_t>& default_filter, Logger& log,
                     std::unique_ptr<Session>& out, Error& err) {
    TransportTarget target;
    if (!resolve_target(target_text, target, err)) return false;

    SessionConfig sc;
    std::string serr;
    if (!to_session_config(cfg, default_filter, sc, serr)) {
        err.set(ErrorKind::None, serr);            // kind None: report_error() exits EXIT_USAGE
        return false;
    }

    LinkConfig lc = to_link_config(cfg);
    if (target.is_tcp()) log.info("Connecting to " + target.to_string() + "...");
    auto link = open_transport(target, lc, err);
    if (!link) return false;

    log.info(std::string("Connected via ") + transport::kind_name(link->kind()) + " (" +
             target.to_string() + ", read timeout " +
             std::to_string(lc.effective_read_timeout(target.is_tcp())) + " ms)");

    out = std::make_unique<Session>(std::move(link), sc, log);
    return true;
}


// ---------- reporting ----------

int report_error(const Error& err) {
    if (err.kind == ErrorKind::None) return report_usage(err.reason);
    std::cerr << "status=error " << err.describe() << "\n";
    return exit_code_for(err.kind);
}

int report_usage(const std::string& reason) {
    std::cerr << "status=error reason=" << reason << "\n";
    return EXIT_USAGE;
}

} // namespace dacwire
