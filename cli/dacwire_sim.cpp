/**
 * @file dacwire_sim.cpp
 * @brief dacwire-sim: TCP stand-in for the controller.
 *
 * Listens on an IPv4 address (and optionally an IPv6 one), accepts any number of clients
 * and serves them from a single poll() loop. Every complete 4-byte frame a client sends is
 * applied to one shared DeviceModel and answered with the 2-byte big-endian status
 * (0x0000 OK, 0xFFFF for frames that do not decode). Bytes of an incomplete frame wait for
 * the rest; a frame never spans two clients.
 *
 * Usage:
 *   dacwire-sim                          # 127.0.0.1:8080
 *   dacwire-sim --address 0.0.0.0 --ipv6 :: --port 9000 -v
 */

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <poll.h>

#include "CLI/CLI.hpp"

#include "dacwire/device_model.hpp"
#include "fd_io.hpp"
#include "tcp_listener.hpp"
#include "tool_common.hpp"

using namespace dacwire;

static constexpr int    POLL_MS          = 100;
static constexpr int    REPLY_TIMEOUT_MS = 1000;
static constexpr size_t READ_CHUNK       = 1024;

struct Client {
    int            fd{-1};
    std::string    peer;
    FrameAssembler frames;
};

// Decode everything buffered for one client and write back one status per frame.
// Returns false when the client has to be dropped.
static bool serve_client(Client& c, DeviceModel& dev, const Logger& log) {
    uint8_t in[READ_CHUNK];
    IoResult rr = read_bounded(c.fd, in, sizeof(in), 0, 0);
    if (rr.status == IoStatus::Closed) {
        log.info("Client " + c.peer + " disconnected");
        return false;
    }
    if (rr.status == IoStatus::Error) {
        log.warn("read from " + c.peer + " failed: " + reason_for_errno("read_failed", rr.err));
        return false;
    }
    if (rr.count == 0) return true;

    log.debug("<- " + c.peer + " " + to_hex(in, rr.count));

    std::vector<uint8_t> replies;
    for (size_t i = 0; i < rr.count; ++i) {
        if (!c.frames.push(in[i])) continue;

        const Frame& f = c.frames.frame();
        const uint16_t status = dev.apply(f.data(), f.size());
        if (status == STATUS_OK) log.debug("   " + std::string(describe(dev.last()).c_str()));
        else                     log.debug("   rejected " + to_hex(f.data(), f.size()));

        uint8_t sb[STATUS_REPLY_SIZE];
        DeviceModel::status_bytes(status, sb);
        replies.insert(replies.end(), sb, sb + STATUS_REPLY_SIZE);
    }
    if (replies.empty()) return true;

    IoResult wr = write_bounded(c.fd, replies.data(), replies.size(), REPLY_TIMEOUT_MS, true);
    if (wr.status != IoStatus::Ok) {
        log.warn("reply to " + c.peer + " failed: " + io_status_name(wr.status));
        return false;
    }
    log.debug("-> " + c.peer + " " + to_hex(replies.data(), replies.size()));
    return true;
}

static void print_summary(const DeviceModel& dev, const Logger& log) {
    log.info("frames ok=" + std::to_string(dev.frames_ok()) +
             " error=" + std::to_string(dev.frames_error()) +
             " keepalives=" + std::to_string(dev.keepalives()) +
             " ldac=" + std::to_string(dev.ldac_count()));
    std::string line = "dac";
    for (uint8_t ch = 0; ch < DAC_CHANNELS; ++ch) line += " " + std::to_string(dev.dac(ch));
    log.info(line);
    line = "gpio";
    for (uint8_t p = 0; p < GPIO_PINS; ++p) line += dev.gpio(p) ? " 1" : " 0";
    log.info(line);
}

int main(int argc, char** argv) {
    CLI::App app{"dacwire-sim: TCP server that answers like the DAC controller"};

    std::string address = "127.0.0.1";
    std::string address6;
    uint16_t port = 8080;
    bool verbose = false;
    bool no_color = false;

    app.add_option("-a,--address", address, "IPv4 bind address");
    app.add_option("--ipv6", address6, "Also listen on this IPv6 address (e.g. :: or ::1)");
    app.add_option("-p,--port", port, "TCP port")->check(CLI::Range(1, 65535));
    app.add_flag("-v,--verbose", verbose, "Log every frame and reply");
    app.add_flag("--no-color", no_color, "Disable ANSI colours");

    CLI11_PARSE(app, argc, argv);

    install_signal_handlers();
    Logger log(verbose, !no_color && stdout_is_tty());

    // ---------- listeners ----------
    std::vector<int> listeners;
    std::vector<std::string> shown;
    int err = 0;
    int fd4 = listen_tcp(address, port, err);
    if (fd4 < 0) return report_error(Error{ErrorKind::ConnectionError, reason_for_errno("bind_failed", err), err});
    listeners.push_back(fd4);
    shown.push_back(address + ":" + std::to_string(port));

    if (!address6.empty()) {
        int fd6 = listen_tcp(address6, port, err);
        if (fd6 < 0) {
            close_socket(fd4);
            return report_error(Error{ErrorKind::ConnectionError, reason_for_errno("bind_failed", err), err});
        }
        listeners.push_back(fd6);
        shown.push_back("[" + address6 + "]:" + std::to_string(port));
    }

    for (const auto& s : shown) log.info("TCP DAC simulator listening on " + s);
    log.info("Use Ctrl+C to stop the server");

    // ---------- loop ----------
    DeviceModel dev;
    std::vector<Client> clients;

    while (!stop_requested()) {
        std::vector<pollfd> pfds;
        for (int fd : listeners) pfds.push_back(pollfd{fd, POLLIN, 0});
        for (const auto& c : clients) pfds.push_back(pollfd{c.fd, POLLIN, 0});

        int pr = ::poll(pfds.data(), pfds.size(), POLL_MS);
        if (pr <= 0) continue;   // timeout or EINTR; the loop condition checks the stop flag

        for (size_t i = 0; i < listeners.size(); ++i) {
            if (!(pfds[i].revents & POLLIN)) continue;
            Client c;
            while ((c.fd = accept_client(listeners[i], c.peer)) >= 0) {
                log.info("Client connected: " + c.peer);
                clients.push_back(c);
                c = Client{};
            }
        }

        // pfds only covers the clients that existed before this round's accepts.
        std::vector<Client> kept;
        for (size_t k = 0; k < clients.size(); ++k) {
            const size_t pi = listeners.size() + k;
            const bool ready = pi < pfds.size() && pfds[pi].revents != 0;
            if (ready && !serve_client(clients[k], dev, log)) {
                if (clients[k].frames.pending() != 0)
                    log.debug(clients[k].peer + " left " + std::to_string(clients[k].frames.pending()) +
                              " byte(s) of an incomplete frame");
                close_socket(clients[k].fd);
                continue;
            }
            kept.push_back(clients[k]);
        }
        clients.swap(kept);
    }

    log.info("Shutting down");
    for (auto& c : clients) close_socket(c.fd);
    for (int fd : listeners) close_socket(fd);
    print_summary(dev, log);
    return EXIT_OK;
}
