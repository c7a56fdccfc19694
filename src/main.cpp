/**
 * @file main.cpp
 * @brief dacwire-cli: one-shot command runner and serial scanner.
 *
 * Responsibilities:
 *  - Parse the target and command words (CLI11) and turn the words into Commands through
 *    the dispatcher, before anything is opened.
 *  - Open the link, send each Command, read each reply, print one status line per frame.
 *  - --scan: probe serial candidates, print them, save ~/.config/dacwire/devices.json.
 *
 * Output (pretty):  status=ok cmd="DAC 3 = 4096" frame=03 00 10 00 reply=00 00 device=0x0000
 * Exit codes: 0 ok, 1 connection/write failure, 2 usage, 3 reply timeout,
 *             4 invalid target, 5 device answered with an error status.
 */

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"

#include "command_dispatch.hpp"   // build_from_tokens()
#include "device_scan.hpp"        // discover_devices(), save_registry()
#include "tool_common.hpp"

using json = nlohmann::json;
using namespace dacwire;

static json result_json(const Command& cmd, const SendResult& r) {
    const Frame f = encode(cmd);
    json j;
    j["command"]   = describe(cmd).c_str();
    j["frame"]     = to_hex(f.data(), f.size());
    j["status"]    = send_status_name(r.status);
    j["written"]   = r.bytes_written;
    j["elapsed_ms"] = r.elapsed_ms;
    if (r.response_requested) {
        j["response"] = response_kind_name(r.response.kind);
        j["reply"]    = to_hex(r.response_bytes.data(), r.response_bytes.size());
        if (r.response.has_status) j["device_status"] = r.response.status;
    }
    return j;
}

static int run_scan(int probe_ms, const std::string& format, const Ansi& ansi) {
    auto devs = discover_devices(probe_ms);
    if (format == "json") {
        json arr = json::array();
        for (const auto& d : devs) arr.push_back(d);
        std::cout << arr.dump(2) << "\n";
    } else {
        if (devs.empty()) std::cout << ansi.dim("no serial candidates found") << "\n";
        for (const auto& d : devs) {
            std::cout << "dev=" << d.dev_path
                      << " online=" << (d.online ? 1 : 0);
            if (!d.by_id.empty())  std::cout << " by_id=" << d.by_id;
            if (!d.online)         std::cout << " reason=" << d.reason;
            else                   std::cout << " device=" << hex16(d.status);
            std::cout << "\n";
        }
    }
    std::string err;
    if (!save_registry(devs, err)) std::cerr << "status=warn reason=" << err << "\n";
    return EXIT_OK;
}

int main(int argc, char** argv) {
    ToolConfig cfg;
    std::string cfg_err;
    if (!preload_config(argc, argv, cfg, cfg_err)) return report_usage(cfg_err);

    CLI::App app{"dacwire-cli: send DAC/GPIO controller commands over serial or TCP"};

    std::string target;
    std::vector<std::string> words;
    bool do_scan = false;
    int probe_ms = 300;
    std::string format = "pretty";
    bool allow_missing = false;

    CommonOptions common;
    add_common_options(app, cfg, common);

    app.add_option("target", target, "Serial path (/dev/ttyACM0, COM5) or TCP address (192.168.1.100:8080, [::1]:8080)");
    app.add_option("command", words,
        "dac <ch> <v> | attach <ch> <t> | table <t> <i> <v> | offset <n> | gpio <pin> on|off | "
        "keepalive | ldac | register <r> <v> | rs422 <speed>");
    app.add_flag("--scan", do_scan, "Probe serial ports, print them, save the device registry");
    app.add_option("--probe-timeout", probe_ms, "Per-port probe reply timeout in ms")->check(CLI::Range(10, 10000));
    app.add_option("--format", format, "Output format: pretty|json")->check(CLI::IsMember({"pretty", "json"}));
    app.add_flag("--allow-missing-reply", allow_missing, "Do not fail when a reply times out");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (common.dump_config) {
        std::cout << config_to_json(cfg).dump(2) << "\n";
        return EXIT_OK;
    }

    Ansi ansi;
    ansi.enabled = use_color(cfg) && format == "pretty";

    if (do_scan) return run_scan(probe_ms, format, ansi);

    if (target.empty()) return report_usage("missing_target");

    // -------- build every frame before touching the link --------
    std::vector<Command> cmds;
    std::string derr;
    if (!build_from_tokens(words, cmds, derr)) return report_usage(derr);

    install_signal_handlers();
    Logger log(cfg.verbose, ansi.enabled, format == "json" ? std::cerr : std::cout);

    std::unique_ptr<Session> session;
    Error err;
    if (!connect_session(target, cfg, {}, log, session, err)) return report_error(err);

    // -------- send --------
    json out = json::array();
    int rc = EXIT_OK;
    for (const auto& cmd : cmds) {
        SendResult r = session->send(cmd);
        const Frame f = encode(cmd);

        if (format == "json") {
            out.push_back(result_json(cmd, r));
        } else {
            std::cout << (r.status == SendStatus::Ok ? ansi.green("status=ok") : ansi.yellow("status=" + std::string(send_status_name(r.status))))
                      << " cmd=\"" << describe(cmd).c_str() << "\""
                      << " frame=" << to_hex(f.data(), f.size());
            if (r.response_requested) {
                std::cout << " reply=" << (r.response_bytes.empty() ? "none" : to_hex(r.response_bytes.data(), r.response_bytes.size()));
                if (r.response.has_status) std::cout << " device=" << hex16(r.response.status);
            }
            std::cout << " elapsed_ms=" << r.elapsed_ms << "\n";
        }

        if (r.failed()) {
            if (format == "json") std::cout << out.dump(2) << "\n";
            session->close();
            return report_error(r.error);
        }
        if (r.status == SendStatus::Timeout && !allow_missing) {
            rc = EXIT_TIMEOUT;
            std::cerr << "status=error reason=" << r.error.reason << "\n";
            break;
        }
        if (r.response.has_status && !r.response.status_ok()) {
            rc = EXIT_DEVICE_STATUS;
            std::cerr << "status=error reason=device_status device=" << hex16(r.response.status) << "\n";
            break;
        }
        if (stop_requested()) break;
    }

    if (format == "json") std::cout << out.dump(2) << "\n";
    session->close();
    return rc;
}
