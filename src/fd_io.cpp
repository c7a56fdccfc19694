// ============================================================================
// fd_io.cpp - poll-bounded I/O shared by the serial and TCP transports
// ============================================================================

#include "fd_io.hpp"

#include <cerrno>
#include <chrono>
#include <poll.h>         // poll(2)
#include <sys/socket.h>   // send, MSG_NOSIGNAL
#include <unistd.h>       // read, write

namespace dacwire {

const char* io_status_name(IoStatus s) {
    switch (s) {
        case IoStatus::Ok:      return "ok";
        case IoStatus::Timeout: return "timeout";
        case IoStatus::Closed:  return "closed";
        case IoStatus::Error:   return "error";
    }
    return "error";
}

uint32_t now_ms_steady32() {
    using namespace std::chrono;
    auto ms = duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
    return static_cast<uint32_t>(ms & 0xFFFFFFFFu);
}

// Milliseconds left before `deadline`, clamped at 0.
static int remaining(uint32_t deadline) {
    int32_t left = static_cast<int32_t>(deadline - now_ms_steady32());
    return left > 0 ? left : 0;
}


// ---------------------------------------------------------------------------
// write_bounded()
// ---------------
// Loop: poll for POLLOUT, write what the driver takes, repeat until the whole
// buffer is out. EAGAIN and EINTR just go round again; the deadline bounds it.
// ---------------------------------------------------------------------------
IoResult write_bounded(int fd, const uint8_t* data, std::size_t len, int timeout_ms, bool is_socket) {
    IoResult r;
    if (fd < 0) { r.status = IoStatus::Error; r.err = EBADF; return r; }

    const uint32_t deadline = now_ms_steady32() + static_cast<uint32_t>(timeout_ms < 0 ? 0 : timeout_ms);
    pollfd pfd{fd, POLLOUT, 0};

    while (r.count < len) {
        int pr = ::poll(&pfd, 1, remaining(deadline));
        if (pr < 0) {
            if (errno == EINTR) continue;
            r.status = IoStatus::Error; r.err = errno; return r;
        }
        if (pr == 0) { r.status = IoStatus::Timeout; return r; }
        if (pfd.revents & (POLLERR | POLLNVAL)) {
            r.status = IoStatus::Error; r.err = EIO; return r;
        }
        if (pfd.revents & POLLHUP) { r.status = IoStatus::Closed; r.err = EPIPE; return r; }

        ssize_t w = is_socket ? ::send(fd, data + r.count, len - r.count, MSG_NOSIGNAL)
                              : ::write(fd, data + r.count, len - r.count);
        if (w > 0) { r.count += static_cast<std::size_t>(w); continue; }
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            if (remaining(deadline) == 0) { r.status = IoStatus::Timeout; return r; }
            continue;
        }
        r.status = IoStatus::Error;
        r.err = (w < 0) ? errno : EIO;
        return r;
    }
    r.status = IoStatus::Ok;
    return r;
}


// ---------------------------------------------------------------------------
// read_bounded()
// --------------
// Accumulate until min_len bytes or the deadline. A zero-byte read after
// POLLIN means the peer closed (socket EOF, tty hang-up).
// ---------------------------------------------------------------------------
IoResult read_bounded(int fd, uint8_t* out, std::size_t cap, std::size_t min_len, int timeout_ms) {
    IoResult r;
    if (fd < 0 || !out) { r.status = IoStatus::Error; r.err = EBADF; return r; }
    if (min_len > cap) min_len = cap;

    const uint32_t deadline = now_ms_steady32() + static_cast<uint32_t>(timeout_ms < 0 ? 0 : timeout_ms);
    pollfd pfd{fd, POLLIN, 0};

    while (r.count < cap) {
        int wait = (min_len == 0) ? 0 : remaining(deadline);
        int pr = ::poll(&pfd, 1, wait);
        if (pr < 0) {
            if (errno == EINTR) continue;
            r.status = IoStatus::Error; r.err = errno; return r;
        }
        if (pr == 0) break;                                  // deadline (or nothing pending)

        if (pfd.revents & (POLLERR | POLLNVAL)) {
            r.status = IoStatus::Error; r.err = EIO; return r;
        }
        if (!(pfd.revents & POLLIN) && (pfd.revents & POLLHUP)) {
            r.status = IoStatus::Closed; return r;
        }

        ssize_t n = ::read(fd, out + r.count, cap - r.count);
        if (n > 0) {
            r.count += static_cast<std::size_t>(n);
            if (min_len == 0 || r.count >= min_len) break;
            continue;
        }
        if (n == 0) { r.status = IoStatus::Closed; return r; }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            if (remaining(deadline) == 0) break;
            continue;
        }
        r.status = IoStatus::Error; r.err = errno;
        return r;
    }

    r.status = (r.count >= min_len) ? IoStatus::Ok : IoStatus::Timeout;
    return r;
}

} // namespace dacwire
