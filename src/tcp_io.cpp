// ============================================================================
// tcp_io.cpp - implementation for tcp_io.hpp
// ============================================================================

#include "tcp_io.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>          // getaddrinfo
#include <netinet/in.h>
#include <netinet/tcp.h>    // TCP_NODELAY
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace dacwire {

static bool set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// ---------------------------------------------------------------------------
// wait_connected()
// ----------------
// A non-blocking connect() returns EINPROGRESS; completion shows up as
// POLLOUT, and SO_ERROR then says whether it actually succeeded.
// ---------------------------------------------------------------------------
static int wait_connected(int fd, int timeout_ms) {
    pollfd pfd{fd, POLLOUT, 0};
    int pr;
    do {
        pr = ::poll(&pfd, 1, timeout_ms);
    } while (pr < 0 && errno == EINTR);

    if (pr == 0) return ETIMEDOUT;
    if (pr < 0)  return errno;

    int so_err = 0;
    socklen_t len = sizeof(so_err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &len) != 0) return errno;
    return so_err;
}

int connect_tcp(const std::string& host, uint16_t port, bool ipv6, int timeout_ms, int& err) {
    err = 0;

    addrinfo hints{};
    hints.ai_family   = ipv6 ? AF_INET6 : AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags    = AI_NUMERICHOST | AI_NUMERICSERV;

    addrinfo* res = nullptr;
    const std::string service = std::to_string(port);
    if (::getaddrinfo(host.c_str(), service.c_str(), &hints, &res) != 0 || !res) {
        err = EINVAL;                                   // not a numeric address
        return -1;
    }

    int fd = ::socket(res->ai_family, res->ai_socktype | SOCK_CLOEXEC, res->ai_protocol);
    if (fd < 0) {
        err = errno;
        ::freeaddrinfo(res);
        return -1;
    }

    if (!set_nonblocking(fd)) {
        err = errno;
        ::freeaddrinfo(res);
        ::close(fd);
        return -1;
    }

    int rc = ::connect(fd, res->ai_addr, res->ai_addrlen);
    ::freeaddrinfo(res);

    if (rc != 0) {
        if (errno != EINPROGRESS) {
            err = errno;
            ::close(fd);
            return -1;
        }
        int cerr = wait_connected(fd, timeout_ms);
        if (cerr != 0) {
            err = cerr;
            ::close(fd);
            return -1;
        }
    }

    int one = 1;
    if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0) {
        err = errno;
        ::close(fd);
        return -1;
    }
    return fd;
}

void close_tcp(int fd) {
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
}

} // namespace dacwire
