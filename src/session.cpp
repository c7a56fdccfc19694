// ============================================================================
// session.cpp - implementation for session.hpp
// ============================================================================

#include "session.hpp"
#include "fd_io.hpp"   // now_ms_steady32()

#include <algorithm>
#include <chrono>
#include <thread>

namespace dacwire {

using transport::RxResult;
using transport::TxResult;

bool SessionConfig::wants_response(uint8_t opcode) const {
    if (!read_responses) return false;
    if (response_opcodes.empty()) return true;
    return std::find(response_opcodes.begin(), response_opcodes.end(), opcode) != response_opcodes.end();
}

double SessionStats::response_rate() const {
    if (commands_sent == 0) return 0.0;
    return 100.0 * static_cast<double>(responses_received) / static_cast<double>(commands_sent);
}

const char* send_status_name(SendStatus s) {
    switch (s) {
        case SendStatus::Ok:           return "ok";
        case SendStatus::Timeout:      return "timeout";
        case SendStatus::WriteFailure: return "write_failure";
    }
    return "write_failure";
}


Session::Session(std::unique_ptr<transport::ITransport> link, const SessionConfig& cfg, Logger& log)
: link_(std::move(link)), cfg_(cfg), log_(log), clock_(cfg.keepalive_interval_ms) {
    if (cfg_.reply_size == 0) cfg_.reply_size = STATUS_REPLY_SIZE;
}

Session::~Session() { close(); }

void Session::close() {
    if (link_) link_->end();
}

transport::Kind Session::kind() const {
    return link_ ? link_->kind() : transport::Kind::Serial;
}

const char* Session::link_name() const {
    return link_ ? link_->name() : "closed";
}

SendResult Session::send(const Command& cmd) {
    return transfer(cmd);
}


// ---------------------------------------------------------------------------
// transfer()
// ----------
// Phases:
//   1) write the frame (bounded; no retry)
//   2) optional pause (command_delay_ms)
//   3) optional single read of reply_size bytes (bounded)
// Stats are updated as each phase finishes.
// ---------------------------------------------------------------------------
SendResult Session::transfer(const Command& cmd) {
    SendResult r;
    const uint32_t t0 = now_ms_steady32();

    if (!is_open()) {
        r.status = SendStatus::WriteFailure;
        r.error.set(ErrorKind::WriteFailure, "not_open");
        ++stats_.errors;
        return r;
    }

    const Frame frame = encode(cmd);
    log_.debug(std::string("-> ") + to_hex(frame.data(), frame.size()) + "  " + describe(cmd).c_str());

    // 1) write
    TxResult tx = link_->send(frame.data(), frame.size(), r.bytes_written);
    stats_.bytes_sent += r.bytes_written;

    if (tx == TxResult::Error) {
        ++stats_.errors;
        r.status = SendStatus::WriteFailure;
        r.error.set(ErrorKind::WriteFailure, reason_for_errno("write_failed", link_->last_errno()),
                    link_->last_errno());
        r.elapsed_ms = now_ms_steady32() - t0;
        return r;
    }
    ++stats_.commands_sent;
    if (cmd.kind == CommandKind::KeepAlive) ++stats_.keepalives_sent;

    if (tx == TxResult::Timeout) {
        ++stats_.timeouts;
        r.status = SendStatus::Timeout;
        r.error.set(ErrorKind::Timeout, "write_timeout");
        r.elapsed_ms = now_ms_steady32() - t0;
        log_.debug("write timeout after " + std::to_string(r.bytes_written) + "/" +
                   std::to_string(frame.size()) + " bytes");
        return r;                                    // a partial frame gets no reply
    }

    // 2) pacing
    if (cfg_.command_delay_ms)
        std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.command_delay_ms));

    // 3) read
    if (cfg_.wants_response(frame[0])) {
        r.response_requested = true;
        r.response_bytes.resize(cfg_.reply_size);
        std::size_t got = 0;
        RxResult rx = link_->recv(r.response_bytes.data(), r.response_bytes.size(), cfg_.reply_size, got);
        r.response_bytes.resize(got);
        stats_.bytes_received += got;
        r.response = classify_response(r.response_bytes.data(), got, cfg_.reply_size);

        if (rx == RxResult::Error || rx == RxResult::Closed) {
            ++stats_.errors;
            r.status = SendStatus::WriteFailure;
            r.error.set(ErrorKind::WriteFailure,
                        rx == RxResult::Closed ? "peer_closed"
                                               : reason_for_errno("read_failed", link_->last_errno()),
                        rx == RxResult::Closed ? 0 : link_->last_errno());
            r.elapsed_ms = now_ms_steady32() - t0;
            return r;
        }

        if (got > 0) {
            ++stats_.responses_received;
            log_.debug(std::string("<- ") + to_hex(r.response_bytes.data(), got));
        }
        if (r.response.kind != ResponseKind::Bytes) {
            ++stats_.timeouts;
            r.status = SendStatus::Timeout;
            r.error.set(ErrorKind::Timeout, got ? "partial_response" : "read_timeout");
            log_.debug(std::string("read ") + response_kind_name(r.response.kind) + " (" +
                       std::to_string(got) + "/" + std::to_string(cfg_.reply_size) + " bytes)");
        }
    }

    r.elapsed_ms = now_ms_steady32() - t0;
    return r;
}

bool Session::tick(uint32_t now_ms, SendResult* out) {
    if (!clock_.due(now_ms)) return false;

    SendResult r = transfer(make_keepalive());
    if (r.frame_written()) clock_.reset(now_ms);
    if (out) *out = r;
    return true;
}

bool Session::shutdown(const std::vector<uint8_t>& pins) {
    bool all_ok = true;
    for (uint8_t pin : pins) {
        Command c;
        if (!make_gpio_set(pin, false, c)) {
            log_.warn("cleanup skipped invalid gpio pin " + std::to_string(pin));
            all_ok = false;
            continue;
        }
        SendResult r = transfer(c);
        if (r.status == SendStatus::WriteFailure) {
            log_.warn("failed to clear GPIO" + std::to_string(pin) + ": " + r.error.describe());
            all_ok = false;
        } else {
            log_.debug("GPIO" + std::to_string(pin) + " cleared");
        }
    }
    close();
    return all_ok;
}

} // namespace dacwire
