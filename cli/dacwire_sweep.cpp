/**
 * @file dacwire_sweep.cpp
 * @brief dacwire-sweep: init sequence followed by an endless DAC sweep.
 *
 * Responsibilities:
 *  - Connect to a serial or TCP target, send the init sequence (GPIO0/1 on, tables 0 and 1
 *    seeded, channels bound even/odd, three keepalives).
 *  - Send one SweepGenerator frame per period at --rate, feeding keepalives from tick().
 *  - Stop on --duration or Ctrl-C, clear GPIO0/1, print connection statistics.
 *
 * Notes:
 *  - Replies are read only after GPIO, keepalive and LDAC frames unless
 *    --response-commands says otherwise. DAC writes are fire-and-forget by default.
 *  - A soft timeout is not fatal: the loop logs it (verbose) and goes on. A write failure
 *    ends the run with exit code 1 after printing the statistics.
 */

#include <cstdint>
#include <iostream>
#include <string>

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"
#include "etl/vector.h"

#include "dacwire/script.hpp"
#include "fd_io.hpp"            // now_ms_steady32()
#include "tool_common.hpp"

using json = nlohmann::json;
using namespace dacwire;

static const std::vector<uint8_t> DEFAULT_FILTER = { OP_GPIO, OP_KEEPALIVE, OP_LDAC };

static constexpr uint32_t INIT_FRAME_GAP_MS = 50;
static constexpr uint32_t FAILURE_BACKOFF_MS = 100;
static constexpr uint32_t PROGRESS_EVERY    = 100;

// ---------- stats ----------

static json stats_json(const SessionStats& s, uint32_t loops, uint32_t elapsed_ms) {
    json j;
    j["loops"]              = loops;
    j["elapsed_ms"]         = elapsed_ms;
    j["commands_sent"]      = s.commands_sent;
    j["responses_received"] = s.responses_received;
    j["timeouts"]           = s.timeouts;
    j["errors"]             = s.errors;
    j["bytes_sent"]         = s.bytes_sent;
    j["bytes_received"]     = s.bytes_received;
    j["keepalives_sent"]    = s.keepalives_sent;
    j["response_rate"]      = s.response_rate();
    return j;
}

static void print_stats(const Logger& log, const SessionStats& s, uint32_t loops, uint32_t elapsed_ms) {
    const Ansi& a = log.ansi();
    std::ostream& o = log.out();
    o << a.bold("Connection statistics") << "\n"
      << "  loops:              " << loops << "\n"
      << "  elapsed:            " << elapsed_ms << " ms\n"
      << "  commands sent:      " << s.commands_sent << "\n"
      << "  responses received: " << s.responses_received << "\n"
      << "  timeouts:           " << s.timeouts << "\n"
      << "  errors:             " << s.errors << "\n"
      << "  bytes sent:         " << s.bytes_sent << "\n"
      << "  bytes received:     " << s.bytes_received << "\n"
      << "  keepalives sent:    " << s.keepalives_sent << "\n"
      << "  response rate:      " << s.response_rate() << " %\n";
}

// ---------- init ----------

static bool run_init(Session& s, const Logger& log, Error& err) {
    etl::vector<Command, 32> seq;
    if (!build_init_sequence(seq)) {
        err.set(ErrorKind::None, "init_sequence_overflow");
        return false;
    }

    log.info("Sending init sequence (" + std::to_string(seq.size()) + " frames)");
    for (const auto& cmd : seq) {
        SendResult r = s.send(cmd);
        if (r.failed()) { err = r.error; return false; }
        if (r.status == SendStatus::Timeout)
            log.debug(std::string("init: ") + describe(cmd).c_str() + " " + r.error.reason);
        if (stop_requested()) return true;
        sleep_ms(INIT_FRAME_GAP_MS);
    }
    return true;
}

int main(int argc, char** argv) {
    ToolConfig cfg;
    std::string cfg_err;
    if (!preload_config(argc, argv, cfg, cfg_err)) return report_usage(cfg_err);

    CLI::App app{"dacwire-sweep: init the controller, then sweep every DAC channel"};

    std::string target;
    bool skip_init = false;
    bool as_json = false;

    CommonOptions common;
    add_common_options(app, cfg, common);
    app.add_option("target", target, "Serial path or TCP address (host:port, [v6]:port)");
    app.add_flag("--skip-init", skip_init, "Start sweeping without the init sequence");
    app.add_flag("--json", as_json, "Print the final statistics as JSON");

    CLI11_PARSE(app, argc, argv);

    if (common.dump_config) {
        std::cout << config_to_json(cfg).dump(2) << "\n";
        return EXIT_OK;
    }
    if (target.empty()) return report_usage("missing_target");

    install_signal_handlers();
    Logger log(cfg.verbose, use_color(cfg));

    std::unique_ptr<Session> session;
    Error err;
    if (!connect_session(target, cfg, DEFAULT_FILTER, log, session, err)) return report_error(err);

    const uint32_t t0 = now_ms_steady32();
    session->start_clock(t0);

    if (!skip_init && !run_init(*session, log, err)) {
        session->close();
        return report_error(err);
    }

    // ---------- sweep loop ----------
    const uint32_t period   = rate_period_ms(cfg.rate_hz);
    const uint32_t limit_ms = seconds_to_ms(cfg.duration_s);
    SweepGenerator gen;
    int rc = EXIT_OK;

    log.info("Sweeping at " + std::to_string(cfg.rate_hz) + " Hz, Ctrl-C to stop");

    while (!stop_requested()) {
        const uint32_t now = now_ms_steady32();
        if (limit_ms > 0 && now - t0 >= limit_ms) break;

        SendResult ka;
        if (session->tick(now, &ka)) {
            if (ka.failed()) { err = ka.error; rc = report_error(err); break; }
            log.debug("keepalive " + std::string(send_status_name(ka.status)));
        }

        Command cmd = gen.next();
        SendResult r = session->send(cmd);
        if (r.failed()) {
            log.error(std::string("write failed: ") + describe(cmd).c_str() + " " + r.error.describe());
            sleep_ms(FAILURE_BACKOFF_MS);
            rc = report_error(r.error);
            break;
        }

        if (log.verbose() || gen.count() % PROGRESS_EVERY == 0) {
            log.info("Loop " + std::to_string(gen.count()) + ": DAC " + std::to_string(gen.channel()) +
                     " = " + std::to_string(cmd.value));
        }

        if (period > 0) sleep_ms(period);
    }

    const uint32_t elapsed = now_ms_steady32() - t0;
    if (session->is_open() && !session->shutdown({0, 1})) log.warn("GPIO0/GPIO1 may still be on");

    if (as_json) std::cout << stats_json(session->stats(), gen.count(), elapsed).dump(2) << "\n";
    else         print_stats(log, session->stats(), gen.count(), elapsed);
    return rc;
}
