#pragma once
/**
 * @file fd_io.hpp
 * @brief Deadline-bounded read/write on a non-blocking file descriptor.
 *
 * Serial ports and TCP sockets are both plain fds opened with O_NONBLOCK, so one pair of
 * poll(2) loops serves both transports. Every call has a deadline; a short transfer at the
 * deadline is reported as Timeout with the partial count, never as an error.
 */

#include <cstddef>
#include <cstdint>

namespace dacwire {

enum class IoStatus {
    Ok,       ///< requested amount transferred
    Timeout,  ///< deadline hit; `count` may be partial
    Closed,   ///< peer closed / hang-up
    Error     ///< syscall failure, see `err`
};

struct IoResult {
    IoStatus    status{IoStatus::Ok};
    std::size_t count{0};
    int         err{0};
};

const char* io_status_name(IoStatus s);

/**
 * @brief Write all of @p data, polling for POLLOUT, until done or @p timeout_ms elapses.
 * @param is_socket  use send(MSG_NOSIGNAL) so a dead peer gives EPIPE instead of SIGPIPE
 */
IoResult write_bounded(int fd, const uint8_t* data, std::size_t len, int timeout_ms, bool is_socket);

/**
 * @brief Read into @p out until at least @p min_len bytes arrived or @p timeout_ms elapses.
 *
 * Stops early once min_len is reached; never reads more than @p cap. With min_len == 0 it
 * returns whatever is immediately available (possibly nothing) after one poll.
 */
IoResult read_bounded(int fd, uint8_t* out, std::size_t cap, std::size_t min_len, int timeout_ms);

/// Monotonic milliseconds, truncated to 32 bits (wrap-safe when subtracted).
uint32_t now_ms_steady32();

} // namespace dacwire
