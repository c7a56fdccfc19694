#include "transport_factory.hpp"

#include "dacwire/transport/transport_linux_serial.hpp"
#include "dacwire/transport/transport_linux_tcp.hpp"

namespace dacwire {

std::unique_ptr<transport::ITransport> open_transport(const TransportTarget& target,
                                                      const LinkConfig& cfg,
                                                      Error& err) {
    if (target.is_tcp()) {
        transport::TcpConfig tc;
        tc.host               = target.host;
        tc.port               = target.port;
        tc.ipv6               = (target.kind == TargetKind::TcpV6);
        tc.read_timeout_ms    = cfg.effective_read_timeout(true);
        tc.write_timeout_ms   = cfg.write_timeout_ms;
        tc.connect_timeout_ms = cfg.connect_timeout_ms;

        auto t = std::make_unique<transport::LinuxTcp>();
        if (!t->begin(tc)) {
            err.set(ErrorKind::ConnectionError, reason_for_errno("connect", t->last_errno()), t->last_errno());
            return nullptr;
        }
        return t;
    }

    transport::SerialConfig sc;
    sc.path             = target.path;
    sc.baud             = cfg.baud;
    sc.boot_delay_ms    = cfg.boot_delay_ms;
    sc.read_timeout_ms  = cfg.effective_read_timeout(false);
    sc.write_timeout_ms = cfg.write_timeout_ms;

    auto s = std::make_unique<transport::LinuxSerial>();
    if (!s->begin(sc)) {
        err.set(ErrorKind::ConnectionError, reason_for_errno("open_failed", s->last_errno()), s->last_errno());
        return nullptr;
    }
    return s;
}

} // namespace dacwire
