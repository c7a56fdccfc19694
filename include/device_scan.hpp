#pragma once
/**
 * @page dw-device-scan dacwire Device Scan
 * @file device_scan.hpp
 * @brief Find serial-attached controllers on this host and remember where they were.
 *
 * @details
 * PURPOSE
 * -------
 * `dacwire-cli --scan` lists the serial ports that look like a controller, so an operator
 * does not have to guess which /dev/ttyACM* is which. Each candidate gets one KeepAlive
 * frame; a port that answers with a 2-byte status within the probe timeout is online.
 *
 * WHAT THIS DOES
 * --------------
 * - Candidates: symlinks under `/dev/serial/by-id` (stable across replugs), resolved to
 *   their device node. Without that directory: `/dev/ttyACM*` and `/dev/ttyUSB*`.
 * - Probe: open 115200 8N1, send `FD 00 00 00`, wait for 2 bytes, close.
 *   KeepAlive is the one frame with no side effect on outputs.
 * - Registry: save_registry() writes the result to
 *   `$XDG_CONFIG_HOME/dacwire/devices.json` (or `~/.config/dacwire/devices.json`) with
 *   nlohmann::json, so scripts can read the last scan.
 *
 * RELIABILITY AND TRADE-OFFS
 * --------------------------
 * - No libudev: plain filesystem inspection and glob(3).
 * - Probing opens each port briefly. A port another process holds may still open (the
 *   kernel does not lock TTYs) and the probe frame will reach that device too.
 *
 * EXAMPLE
 * -------
 * @code
 *   auto devs = dacwire::discover_devices(300);
 *   for (const auto& d : devs)
 *       std::cout << "dev=" << d.dev_path << " online=" << (d.online ? 1 : 0) << "\n";
 *   std::string err;
 *   if (!dacwire::save_registry(devs, err)) std::cerr << err << "\n";
 * @endcode
 */

#include <cstdint>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace dacwire {

/**
 * @struct DeviceInfo
 * @brief One scanned serial port.
 */
struct DeviceInfo {
    std::string dev_path;    ///< canonical device node, e.g. "/dev/ttyACM0"
    std::string by_id;       ///< /dev/serial/by-id link name, empty for glob fallbacks
    bool        online{false};
    uint16_t    status{0};   ///< status word from the probe reply when online
    std::string reason;      ///< why it is offline ("open_failed_permission_denied", "no_reply", ...)
};

/// Candidate device paths, by-id first, glob fallback otherwise.
std::vector<DeviceInfo> list_candidates();

/// Probe one device in place (sets online/status/reason).
void probe_device(DeviceInfo& dev, int timeout_ms);

/// list_candidates() + probe_device() on each.
std::vector<DeviceInfo> discover_devices(int probe_timeout_ms);

void to_json(nlohmann::json& j, const DeviceInfo& d);

/// Directory holding devices.json (not created here).
std::string registry_dir();

/// Write devices.json. False with @p err set when the directory or file cannot be written.
bool save_registry(const std::vector<DeviceInfo>& devices, std::string& err);

} // namespace dacwire
