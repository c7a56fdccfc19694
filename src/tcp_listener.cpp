// ============================================================================
// tcp_listener.cpp - implementation for tcp_listener.hpp
// ============================================================================

#include "tcp_listener.hpp"

#include <arpa/inet.h>      // inet_ntop
#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace dacwire {

static constexpr int LISTEN_BACKLOG = 16;

int listen_tcp(const std::string& address, uint16_t port, int& err) {
    err = 0;

    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags    = AI_NUMERICHOST | AI_NUMERICSERV | AI_PASSIVE;

    addrinfo* res = nullptr;
    const std::string service = std::to_string(port);
    if (::getaddrinfo(address.c_str(), service.c_str(), &hints, &res) != 0 || !res) {
        err = EINVAL;
        return -1;
    }

    int fd = ::socket(res->ai_family, res->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, res->ai_protocol);
    if (fd < 0) { err = errno; ::freeaddrinfo(res); return -1; }

    int one = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) != 0) {
        err = errno; ::freeaddrinfo(res); ::close(fd); return -1;
    }
    if (res->ai_family == AF_INET6 &&
        ::setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, &one, sizeof(one)) != 0) {
        err = errno; ::freeaddrinfo(res); ::close(fd); return -1;
    }

    if (::bind(fd, res->ai_addr, res->ai_addrlen) != 0) {
        err = errno; ::freeaddrinfo(res); ::close(fd); return -1;
    }
    ::freeaddrinfo(res);

    if (::listen(fd, LISTEN_BACKLOG) != 0) {
        err = errno; ::close(fd); return -1;
    }
    return fd;
}

// "host:port" for v4, "[host]:port" for v6.
static std::string format_peer(const sockaddr_storage& ss) {
    char host[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&ss);
        if (!::inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host))) return "?";
        return std::string(host) + ":" + std::to_string(ntohs(in->sin_port));
    }
    if (ss.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&ss);
        if (!::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host))) return "?";
        return "[" + std::string(host) + "]:" + std::to_string(ntohs(in6->sin6_port));
    }
    return "?";
}

int accept_client(int listen_fd, std::string& peer) {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    int fd = ::accept4(listen_fd, reinterpret_cast<sockaddr*>(&ss), &len, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;

    int one = 1;
    if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0) {
        ::close(fd);
        return -1;
    }
    peer = format_peer(ss);
    return fd;
}

uint16_t bound_port(int fd) {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &len) != 0) return 0;
    if (ss.ss_family == AF_INET)
        return ntohs(reinterpret_cast<const sockaddr_in*>(&ss)->sin_port);
    if (ss.ss_family == AF_INET6)
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&ss)->sin6_port);
    return 0;
}

void close_socket(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace dacwire
