// ============================================================================
// device_scan.cpp - implementation for device_scan.hpp
// ============================================================================

#include "device_scan.hpp"
#include "dacwire/command.hpp"                        // make_keepalive(), encode()
#include "dacwire/transport/transport_linux_serial.hpp"
#include "errors.hpp"                                 // reason_for_errno()

#include <cstdlib>        // getenv
#include <filesystem>
#include <fstream>
#include <glob.h>         // glob(3) fallbacks
#include <system_error>

namespace fs = std::filesystem;
namespace dacwire {

// -------- helpers --------

/*
 * append_glob()
 * -------------
 * Append results of a glob() pattern. glob() allocates; always globfree().
 */
static void append_glob(std::vector<DeviceInfo>& out, const char* pattern) {
    glob_t g{};
    if (glob(pattern, 0, nullptr, &g) == 0) {
        for (size_t i = 0; i < g.gl_pathc; ++i) {
            DeviceInfo d;
            d.dev_path = g.gl_pathv[i];
            out.push_back(d);
        }
    }
    globfree(&g);
}


// -------- public API --------

std::vector<DeviceInfo> list_candidates() {
    std::vector<DeviceInfo> out;
    const fs::path by_id("/dev/serial/by-id");
    std::error_code ec;

    if (fs::exists(by_id, ec)) {
        for (fs::directory_iterator it(by_id, ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_symlink(ec)) continue;
            std::error_code cec;
            auto canon = fs::canonical(it->path(), cec);
            if (cec) continue;
            DeviceInfo d;
            d.dev_path = canon.string();
            d.by_id    = it->path().filename().string();
            out.push_back(d);
        }
    }
    if (out.empty()) {
        append_glob(out, "/dev/ttyACM*");
        append_glob(out, "/dev/ttyUSB*");
    }
    return out;
}

/*
 * probe_device()
 * --------------
 * Phases:
 *   1) open port (raw 8N1, no boot delay),
 *   2) write one KeepAlive frame,
 *   3) read the 2-byte status (bounded by timeout_ms),
 *   4) close (LinuxSerial destructor).
 */
void probe_device(DeviceInfo& dev, int timeout_ms) {
    dev.online = false;
    dev.status = 0;

    transport::SerialConfig sc;
    sc.path             = dev.dev_path;
    sc.read_timeout_ms  = static_cast<uint32_t>(timeout_ms);
    sc.write_timeout_ms = static_cast<uint32_t>(timeout_ms);

    transport::LinuxSerial port;
    if (!port.begin(sc)) {
        dev.reason = reason_for_errno("open_failed", port.last_errno());
        return;
    }

    const Frame f = encode(make_keepalive());
    std::size_t written = 0;
    if (port.send(f.data(), f.size(), written) != transport::TxResult::Ok) {
        dev.reason = "write_failed";
        return;
    }

    uint8_t buf[STATUS_REPLY_SIZE] = {0, 0};
    std::size_t got = 0;
    transport::RxResult rx = port.recv(buf, sizeof(buf), sizeof(buf), got);
    if (rx == transport::RxResult::Error || rx == transport::RxResult::Closed) {
        dev.reason = "read_failed";
        return;
    }
    ResponseView rv = classify_response(buf, got);
    if (rv.kind != ResponseKind::Bytes) {
        dev.reason = got ? "partial_reply" : "no_reply";
        return;
    }
    dev.online = true;
    dev.status = rv.status;
    dev.reason.clear();
}

std::vector<DeviceInfo> discover_devices(int probe_timeout_ms) {
    std::vector<DeviceInfo> devs = list_candidates();
    for (auto& d : devs) probe_device(d, probe_timeout_ms);
    return devs;
}

void to_json(nlohmann::json& j, const DeviceInfo& d) {
    j = nlohmann::json{
        {"dev_path", d.dev_path},
        {"by_id",    d.by_id},
        {"online",   d.online},
        {"status",   d.status},
        {"reason",   d.reason}
    };
}

std::string registry_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return (fs::path(xdg) / "dacwire").string();
    const char* home = std::getenv("HOME");
    return (fs::path(home ? home : "") / ".config" / "dacwire").string();
}

/*
 * save_registry()
 * ---------------
 * Write to a temp file then rename, so a reader never sees half a file.
 */
bool save_registry(const std::vector<DeviceInfo>& devices, std::string& err) {
    const fs::path dir = registry_dir();
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) { err = "config_dir_error:" + ec.message(); return false; }

    nlohmann::json j = nlohmann::json::array();
    for (const auto& d : devices) j.push_back(d);

    const fs::path file = dir / "devices.json";
    fs::path tmp = file;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs) { err = "open_failed:" + tmp.string(); return false; }
        ofs << j.dump(2) << "\n";
        if (!ofs) { err = "write_failed:" + tmp.string(); return false; }
    }
    fs::rename(tmp, file, ec);
    if (ec) { err = "rename_failed:" + ec.message(); return false; }
    return true;
}

} // namespace dacwire
