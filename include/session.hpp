#pragma once
/**
 * @page dw-session dacwire Session
 * @file session.hpp
 * @brief One live link to the controller: send commands, read replies, keep it alive.
 *
 * @details
 * PURPOSE
 * -------
 * Every tool drives the device through a Session. It owns exactly one transport, encodes
 * each Command into its 4-byte frame, writes it, optionally reads one reply, and keeps the
 * device's idle timer fed with KeepAlive frames from tick().
 *
 * POLICY
 * ------
 * - One write per Command. The write is bounded by the write timeout. A short write at the
 *   deadline is a Timeout (soft): it is counted, logged at debug level, and the next send
 *   goes ahead. A channel error is a WriteFailure: the caller must stop using the session.
 *   Writes are never retried.
 * - After a complete write, and only when response reading is on and the frame's opcode
 *   passes the filter, the session reads once, bounded by the read timeout, waiting for
 *   reply_size bytes. Empty or Partial replies are soft timeouts. A closed peer or read
 *   error is reported like a WriteFailure because the link is gone either way.
 * - tick(now) sends a KeepAlive when the SessionClock says the interval elapsed and restarts
 *   the interval at `now` unless the write failed outright. A quiet session therefore emits
 *   exactly one KeepAlive per interval however often tick() runs. KeepAlives passed to
 *   send() directly (init sequences) do not touch the clock.
 *
 * OWNERSHIP
 * ---------
 * Single-threaded. The Session owns the transport through a unique_ptr and closes it in
 * close() or its destructor, whichever comes first.
 *
 * EXAMPLE
 * -------
 * @code
 *   dacwire::Session s(std::move(link), cfg, log);
 *   dacwire::Command c;
 *   dacwire::make_gpio_set(0, true, c);
 *   dacwire::SendResult r = s.send(c);
 *   if (r.status == dacwire::SendStatus::WriteFailure) return r.error;
 *   for (;;) { s.tick(dacwire::now_ms_steady32()); ... }
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "dacwire/command.hpp"
#include "dacwire/session_clock.hpp"
#include "dacwire/transport/transport_base.hpp"
#include "errors.hpp"
#include "log.hpp"

namespace dacwire {

struct SessionConfig {
    bool                 read_responses{true};
    std::vector<uint8_t> response_opcodes;              ///< empty = read after every frame
    std::size_t          reply_size{STATUS_REPLY_SIZE};
    uint32_t             keepalive_interval_ms{5000};   ///< 0 disables tick() keepalives
    uint32_t             command_delay_ms{0};           ///< pause between write and read

    /// Whether a frame with this opcode should be followed by a read.
    bool wants_response(uint8_t opcode) const;
};

struct SessionStats {
    uint64_t commands_sent{0};
    uint64_t responses_received{0};   ///< reads that returned at least one byte
    uint64_t timeouts{0};             ///< short writes plus Empty/Partial reads
    uint64_t errors{0};
    uint64_t bytes_sent{0};
    uint64_t bytes_received{0};
    uint64_t keepalives_sent{0};

    /// responses_received / commands_sent, in percent (0 when nothing was sent).
    double response_rate() const;
};

enum class SendStatus { Ok, Timeout, WriteFailure };

const char* send_status_name(SendStatus s);

struct SendResult {
    SendStatus           status{SendStatus::Ok};
    std::size_t          bytes_written{0};
    bool                 response_requested{false};
    ResponseView         response;
    std::vector<uint8_t> response_bytes;
    uint32_t             elapsed_ms{0};
    Error                error;

    bool failed() const { return status == SendStatus::WriteFailure; }

    /// The whole frame reached the channel (a later read may still have timed out).
    bool frame_written() const { return !failed() && bytes_written == FRAME_SIZE; }
};

class Session {
public:
    Session(std::unique_ptr<transport::ITransport> link, const SessionConfig& cfg, Logger& log);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Encode, write, and maybe read. See POLICY above.
    SendResult send(const Command& cmd);

    /**
     * @brief Send a KeepAlive if the interval elapsed.
     * @param now_ms  caller's monotonic milliseconds
     * @param out     receives the keepalive's result when one was sent (may be null)
     * @return true when a keepalive was attempted
     *
     * The clock restarts only when the full frame was written, so a short write is
     * retried on the next call.
     */
    bool tick(uint32_t now_ms, SendResult* out = nullptr);

    /// Start the keepalive window now instead of on the first tick().
    void start_clock(uint32_t now_ms) { clock_.start(now_ms); }

    /**
     * @brief Best-effort cleanup: set each pin in @p pins off, then close.
     *
     * Failures are logged as warnings and do not stop the remaining pins.
     * @return true when every clear was written
     */
    bool shutdown(const std::vector<uint8_t>& pins);

    /// Close the transport. Safe to call more than once.
    void close();

    bool is_open() const { return link_ && link_->is_open(); }
    transport::Kind kind() const;
    const char* link_name() const;

    const SessionStats&  stats() const  { return stats_; }
    const SessionConfig& config() const { return cfg_; }
    SessionClock&        clock()        { return clock_; }

private:
    SendResult transfer(const Command& cmd);

    std::unique_ptr<transport::ITransport> link_;
    SessionConfig cfg_;
    Logger&       log_;
    SessionClock  clock_;
    SessionStats  stats_;
};

} // namespace dacwire
