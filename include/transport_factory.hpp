#pragma once
/**
 * @file transport_factory.hpp
 * @brief Build and open the right transport for a resolved target.
 *
 *   TransportTarget{SerialPath} -> LinuxSerial  (115200 8N1, read timeout 100 ms)
 *   TransportTarget{TcpV4/V6}   -> LinuxTcp     (TCP_NODELAY, read timeout 200 ms)
 *
 * The caller gets a std::unique_ptr it owns; dropping it closes the channel.
 */

#include <cstdint>
#include <memory>
#include "dacwire/transport/transport_base.hpp"
#include "errors.hpp"
#include "target.hpp"

namespace dacwire {

static constexpr uint32_t SERIAL_READ_TIMEOUT_MS = 100;
static constexpr uint32_t TCP_READ_TIMEOUT_MS    = 200;
static constexpr uint32_t WRITE_TIMEOUT_MS       = 1000;
static constexpr uint32_t CONNECT_TIMEOUT_MS     = 5000;

struct LinkConfig {
    uint32_t read_timeout_ms{0};       ///< 0 = per-kind default above
    uint32_t write_timeout_ms{WRITE_TIMEOUT_MS};
    uint32_t connect_timeout_ms{CONNECT_TIMEOUT_MS};
    int      baud{115200};
    int      boot_delay_ms{0};

    uint32_t effective_read_timeout(bool tcp) const {
        if (read_timeout_ms) return read_timeout_ms;
        return tcp ? TCP_READ_TIMEOUT_MS : SERIAL_READ_TIMEOUT_MS;
    }
};

/**
 * @brief Construct and begin() a transport for @p target.
 * @return nullptr on failure, with @p err set to ConnectionError and a reason such as
 *         "open_failed_permission_denied" or "connect_refused".
 */
std::unique_ptr<transport::ITransport> open_transport(const TransportTarget& target,
                                                      const LinkConfig& cfg,
                                                      Error& err);

} // namespace dacwire
