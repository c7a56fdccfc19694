/**
 * @file dacwire_bridge.cpp
 * @brief dacwire-bridge: expose one serial-attached controller on a TCP port.
 *
 * Responsibilities:
 *  - Open the serial device once (115200 8N1, no flow control, 200 ms reply timeout).
 *  - Listen on 0.0.0.0 and :: (or one --bind address), port 2012 by default.
 *  - Cut each client's byte stream into 4-byte frames, write every frame to the serial
 *    link, read its reply and relay the reply to that client only.
 *
 * Reply framing:
 *   [0x00, status]              standard, 2 bytes
 *   [0x01, n, payload(n)]       extended, 2 + n bytes
 * The bridge reads the 2-byte header first, then as many bytes as the header announces.
 * A reply that does not arrive in time is dropped (logged with -v); the client sees no
 * bytes for that frame and its own read timeout applies.
 *
 * Clients are served one frame at a time from a single poll() loop, so frames from two
 * clients never interleave on the serial line.
 */

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <poll.h>

#include "CLI/CLI.hpp"

#include "dacwire/device_model.hpp"     // FrameAssembler
#include "dacwire/transport/transport_linux_serial.hpp"
#include "fd_io.hpp"
#include "tcp_listener.hpp"
#include "tool_common.hpp"

using namespace dacwire;

static constexpr uint16_t DEFAULT_BRIDGE_PORT  = 2012;
static constexpr uint32_t BRIDGE_READ_MS       = 200;
static constexpr int      POLL_MS              = 100;
static constexpr int      CLIENT_WRITE_MS      = 1000;
static constexpr size_t   MAX_REPLY            = 2 + 255;

struct Client {
    int            fd{-1};
    std::string    peer;
    FrameAssembler frames;
};

// ---------- serial side ----------

/**
 * Write one frame and collect its reply.
 * @return false when the serial link failed (the bridge stops); a missing reply is not a
 *         failure and leaves @p reply empty.
 */
static bool exchange(transport::LinuxSerial& link, const Frame& f, std::vector<uint8_t>& reply,
                     const Logger& log, Error& err) {
    reply.clear();

    size_t written = 0;
    transport::TxResult tx = link.send(f.data(), f.size(), written);
    if (tx == transport::TxResult::Error) {
        err.set(ErrorKind::WriteFailure, reason_for_errno("write_failed", link.last_errno()), link.last_errno());
        return false;
    }
    if (tx == transport::TxResult::Timeout) {
        log.warn("serial write timeout (" + std::to_string(written) + "/" + std::to_string(f.size()) + " bytes)");
        return true;
    }

    uint8_t buf[MAX_REPLY];
    size_t got = 0;
    transport::RxResult rx = link.recv(buf, sizeof(buf), STATUS_REPLY_SIZE, got);
    if (rx == transport::RxResult::Error || rx == transport::RxResult::Closed) {
        err.set(ErrorKind::WriteFailure,
                rx == transport::RxResult::Closed ? "device_closed" : reason_for_errno("read_failed", link.last_errno()),
                link.last_errno());
        return false;
    }
    if (got < STATUS_REPLY_SIZE) {
        log.debug("no reply to " + to_hex(f.data(), f.size()) + " (" + std::to_string(got) + " bytes)");
        return true;
    }

    const size_t need = reply_length_from_header(buf, got);
    if (got < need) {
        size_t more = 0;
        rx = link.recv(buf + got, need - got, need - got, more);
        if (rx == transport::RxResult::Error || rx == transport::RxResult::Closed) {
            err.set(ErrorKind::WriteFailure, reason_for_errno("read_failed", link.last_errno()), link.last_errno());
            return false;
        }
        got += more;
        if (got < need) {
            log.debug("short extended reply " + std::to_string(got) + "/" + std::to_string(need));
            return true;
        }
    }

    reply.assign(buf, buf + need);
    return true;
}

// ---------- client side ----------

enum class ClientResult { Keep, Drop, LinkFailed };

static ClientResult serve_client(Client& c, transport::LinuxSerial& link, const Logger& log, Error& err) {
    uint8_t in[1024];
    IoResult rr = read_bounded(c.fd, in, sizeof(in), 0, 0);
    if (rr.status == IoStatus::Closed) {
        log.info("Client " + c.peer + " disconnected");
        return ClientResult::Drop;
    }
    if (rr.status == IoStatus::Error) {
        log.warn("read from " + c.peer + " failed: " + reason_for_errno("read_failed", rr.err));
        return ClientResult::Drop;
    }
    if (rr.count == 0) return ClientResult::Keep;

    log.debug("TCP -> serial " + c.peer + ": " + to_hex(in, rr.count));

    std::vector<uint8_t> reply;
    for (size_t i = 0; i < rr.count; ++i) {
        if (!c.frames.push(in[i])) continue;
        if (!exchange(link, c.frames.frame(), reply, log, err)) return ClientResult::LinkFailed;
        if (reply.empty()) continue;

        log.debug("serial -> TCP " + c.peer + ": " + to_hex(reply.data(), reply.size()));
        IoResult wr = write_bounded(c.fd, reply.data(), reply.size(), CLIENT_WRITE_MS, true);
        if (wr.status != IoStatus::Ok) {
            log.warn("write to " + c.peer + " failed: " + io_status_name(wr.status));
            return ClientResult::Drop;
        }
    }
    return ClientResult::Keep;
}

int main(int argc, char** argv) {
    CLI::App app{"dacwire-bridge: serial-to-TCP bridge for the DAC controller"};

    std::string device;
    std::string bind;
    uint16_t port = DEFAULT_BRIDGE_PORT;
    int baud = DEFAULT_BAUD;
    uint32_t read_ms = BRIDGE_READ_MS;
    bool verbose = false;
    bool no_color = false;

    app.add_option("device", device, "Serial device (/dev/ttyACM0, /dev/serial/by-id/...)")->required();
    app.add_option("-p,--port", port, "TCP port to listen on")->check(CLI::Range(1, 65535));
    app.add_option("-b,--bind", bind, "Bind to one address instead of 0.0.0.0 and ::");
    app.add_option("--baud", baud, "Serial baud rate");
    app.add_option("--read-timeout", read_ms, "Serial reply timeout in ms")->check(CLI::Range(1u, 60000u));
    app.add_flag("-v,--verbose", verbose, "Log every forwarded frame and reply");
    app.add_flag("--no-color", no_color, "Disable ANSI colours");

    CLI11_PARSE(app, argc, argv);

    install_signal_handlers();
    Logger log(verbose, !no_color && stdout_is_tty());

    // ---------- serial ----------
    transport::SerialConfig sc;
    sc.path = device;
    sc.baud = baud;
    sc.read_timeout_ms = read_ms;
    sc.write_timeout_ms = WRITE_TIMEOUT_MS;
    transport::LinuxSerial link;
    if (!link.begin(sc)) {
        return report_error(Error{ErrorKind::ConnectionError,
                                  reason_for_errno("open_failed", link.last_errno()), link.last_errno()});
    }
    log.info("Opened serial port: " + device + " at " + std::to_string(baud) + " 8N1");

    // ---------- listeners ----------
    std::vector<std::string> addrs;
    if (bind.empty()) addrs = {"0.0.0.0", "::"};
    else              addrs = {bind};

    std::vector<int> listeners;
    for (const auto& a : addrs) {
        int err = 0;
        int fd = listen_tcp(a, port, err);
        if (fd < 0) {
            for (int l : listeners) close_socket(l);
            return report_error(Error{ErrorKind::ConnectionError, reason_for_errno("bind_failed", err), err});
        }
        listeners.push_back(fd);
        const bool v6 = a.find(':') != std::string::npos;
        log.info("TCP server listening on " + (v6 ? "[" + a + "]" : a) + ":" + std::to_string(port) +
                 (v6 ? " (IPv6)" : " (IPv4)"));
    }

    // ---------- loop ----------
    std::vector<Client> clients;
    Error link_err;
    bool link_failed = false;

    while (!stop_requested() && !link_failed) {
        std::vector<pollfd> pfds;
        for (int fd : listeners) pfds.push_back(pollfd{fd, POLLIN, 0});
        for (const auto& c : clients) pfds.push_back(pollfd{c.fd, POLLIN, 0});

        if (::poll(pfds.data(), pfds.size(), POLL_MS) <= 0) continue;

        for (size_t i = 0; i < listeners.size(); ++i) {
            if (!(pfds[i].revents & POLLIN)) continue;
            Client c;
            while ((c.fd = accept_client(listeners[i], c.peer)) >= 0) {
                log.info("Client connected: " + c.peer);
                clients.push_back(c);
                c = Client{};
            }
        }

        std::vector<Client> kept;
        for (size_t k = 0; k < clients.size(); ++k) {
            const size_t pi = listeners.size() + k;
            ClientResult res = ClientResult::Keep;
            if (!link_failed && pi < pfds.size() && pfds[pi].revents != 0)
                res = serve_client(clients[k], link, log, link_err);

            if (res == ClientResult::LinkFailed) link_failed = true;
            if (res == ClientResult::Drop) { close_socket(clients[k].fd); continue; }
            kept.push_back(clients[k]);
        }
        clients.swap(kept);
    }

    for (auto& c : clients) close_socket(c.fd);
    for (int fd : listeners) close_socket(fd);
    link.end();

    if (link_failed) return report_error(link_err);
    log.info("Server shutdown complete.");
    return EXIT_OK;
}
