/**
 * @file dacwire_demo.cpp
 * @brief dacwire-demo: walk the controller through every documented feature.
 *
 * Sequence:
 *   1. all DACs to 0, GPIO0 and GPIO1 on
 *   2. direct values 0xFFFF, 0x0100, 0x1000, 0x8000, 0xFFFF on all channels (one step each)
 *   3. channels 0,1 / 4,5 bound to table 0, 2,3 / 6,7 bound to table 1
 *   4. table 0 filled ascending, table 1 descending, 10 entries from offset 48, step 0x3FFF
 *   5. table offset cycled 48..57 for --cycles rounds
 *   6. RS-422 speed registers (2 Mbit/s by default)
 *   7. keepalive every interval until Ctrl-C, then GPIO1 cleared
 *
 * Every frame must be answered with a 2-byte status 0x0000 (strict mode). A missing reply
 * exits 3, an error status exits 5, a broken link exits 1. --no-responses turns the checks
 * off for devices that never answer.
 */

#include <cstdint>
#include <iostream>
#include <string>

#include "CLI/CLI.hpp"
#include "etl/vector.h"

#include "dacwire/script.hpp"
#include "fd_io.hpp"
#include "tool_common.hpp"

using namespace dacwire;

static const uint16_t DIRECT_VALUES[] = { 0xFFFF, 0x0100, 0x1000, 0x8000, 0xFFFF };

namespace {

// Sends frames and enforces the strict reply rule.
class DemoRunner {
public:
    DemoRunner(Session& s, const Logger& log, bool strict)
    : s_(s), log_(log), strict_(strict) {}

    bool send(const Command& cmd) {
        SendResult r = s_.send(cmd);
        log_.debug(std::string(describe(cmd).c_str()) + " -> " + send_status_name(r.status));

        if (r.failed()) return fail(exit_code_for(r.error.kind), r.error.describe());
        if (!strict_ || !r.response_requested) return true;
        if (r.status == SendStatus::Timeout)
            return fail(EXIT_TIMEOUT, "reason=" + r.error.reason + " cmd=\"" + describe(cmd).c_str() + "\"");
        if (!r.response.status_ok())
            return fail(EXIT_DEVICE_STATUS, "reason=device_status device=" + hex16(r.response.status) +
                        " cmd=\"" + describe(cmd).c_str() + "\"");
        return true;
    }

    template <typename Vec>
    bool send_all(const Vec& cmds) {
        for (const auto& c : cmds) {
            if (stop_requested()) return true;
            if (!send(c)) return false;
        }
        return true;
    }

    int exit_code() const { return code_; }

private:
    bool fail(int code, const std::string& detail) {
        std::cerr << "status=error " << detail << "\n";
        code_ = code;
        return false;
    }

    Session&      s_;
    const Logger& log_;
    bool          strict_;
    int           code_{EXIT_OK};
};

} // namespace

static bool run_sequence(DemoRunner& run, const Logger& log, uint32_t step_ms, int cycles, uint32_t speed) {
    const Ansi& a = log.ansi();

    // 1. reset
    log.info(a.bold("[1] DACs to 0, GPIO0/GPIO1 on"));
    {
        etl::vector<Command, DAC_CHANNELS + 2> seq;
        if (!build_all_channels(0, seq) || !build_gpio_enable(seq)) return false;
        if (!run.send_all(seq)) return false;
    }

    // 2. direct values
    log.info(a.bold("[2] Direct values"));
    for (uint16_t v : DIRECT_VALUES) {
        if (stop_requested()) return true;
        etl::vector<Command, DAC_CHANNELS> seq;
        if (!build_all_channels(v, seq)) return false;
        log.info("  all channels = " + hex16(v));
        if (!run.send_all(seq)) return false;
        sleep_ms(step_ms);
    }

    // 3-4. tables
    log.info(a.bold("[3] Table bindings"));
    {
        etl::vector<Command, DAC_CHANNELS> seq;
        if (!build_demo_bindings(seq)) return false;
        if (!run.send_all(seq)) return false;
    }
    log.info(a.bold("[4] Table fill (offset " + std::to_string(DEMO_OFFSET_BASE) + ", " +
                    std::to_string(DEMO_TABLE_LEN) + " entries)"));
    {
        etl::vector<Command, 2 * DEMO_TABLE_LEN> seq;
        if (!build_table_fill(0, DEMO_OFFSET_BASE, DEMO_TABLE_LEN, DEMO_TABLE_STEP, true, seq)) return false;
        if (!build_table_fill(1, DEMO_OFFSET_BASE, DEMO_TABLE_LEN, DEMO_TABLE_STEP, false, seq)) return false;
        if (!run.send_all(seq)) return false;
    }

    // 5. offset cycling
    log.info(a.bold("[5] Offset cycling x" + std::to_string(cycles)));
    for (int c = 0; c < cycles && !stop_requested(); ++c) {
        for (uint8_t i = 0; i < DEMO_TABLE_LEN && !stop_requested(); ++i) {
            const uint8_t offset = static_cast<uint8_t>(DEMO_OFFSET_BASE + i);
            if (!run.send(make_use_table_offset(offset))) return false;
            log.debug("offset " + std::to_string(offset));
            sleep_ms(step_ms);
        }
        log.info("  cycle " + std::to_string(c + 1) + "/" + std::to_string(cycles));
    }

    // 6. RS-422
    log.info(a.bold("[6] RS-422 speed " + std::to_string(speed)));
    {
        etl::vector<Command, 2> seq;
        if (!build_rs422_config(speed, seq)) return false;
        if (!run.send_all(seq)) return false;
    }
    return true;
}

int main(int argc, char** argv) {
    ToolConfig cfg;
    std::string cfg_err;
    if (!preload_config(argc, argv, cfg, cfg_err)) return report_usage(cfg_err);

    CLI::App app{"dacwire-demo: demonstrate DAC, table, GPIO and register commands"};

    std::string target;
    int cycles = 20;
    uint32_t step_ms = 1000;
    uint32_t speed = DEMO_RS422_SPEED;

    CommonOptions common;
    add_common_options(app, cfg, common);
    app.add_option("target", target, "Serial path or TCP address (host:port, [v6]:port)");
    app.add_option("--cycles", cycles, "Offset cycling rounds")->check(CLI::Range(0, 100000));
    app.add_option("--step-delay", step_ms, "Pause between demo steps in ms")->check(CLI::Range(0u, 60000u));
    app.add_option("--rs422-speed", speed, "RS-422 speed written to registers 1/2")->check(CLI::PositiveNumber);

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
    if (!connect_session(target, cfg, {}, log, session, err)) return report_error(err);

    DemoRunner run(*session, log, !cfg.no_responses);
    if (!run_sequence(run, log, step_ms, cycles, speed)) {
        if (session->is_open() && !session->shutdown({1})) log.warn("GPIO1 may still be on");
        return run.exit_code() != EXIT_OK ? run.exit_code() : report_usage("sequence_overflow");
    }

    // 7. keepalive loop; the session clock already paces it
    if (!stop_requested()) log.info(log.ansi().bold("[7] Keepalive loop, Ctrl-C to stop"));
    session->start_clock(now_ms_steady32());
    uint32_t sent = 0;
    int rc = EXIT_OK;
    while (!stop_requested()) {
        SendResult r;
        if (session->tick(now_ms_steady32(), &r)) {
            if (r.failed()) { rc = report_error(r.error); break; }
            ++sent;
            log.info("Keepalive " + std::to_string(sent) + " sent");
        }
        sleep_ms(50);
    }

    if (session->is_open()) {
        log.info("Clearing GPIO1");
        if (!session->shutdown({1})) log.warn("GPIO1 may still be on");
    }
    return rc;
}
