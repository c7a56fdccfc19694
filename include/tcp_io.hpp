#pragma once
/**
 * @file tcp_io.hpp
 * @brief Client-side TCP connect with a deadline, for the LinuxTcp transport.
 *
 * The socket comes back non-blocking with TCP_NODELAY set, so each 4-byte frame leaves
 * immediately instead of waiting for Nagle to coalesce it. Reads and writes then go
 * through fd_io.hpp exactly like a serial fd.
 */

#include <cstdint>
#include <string>

namespace dacwire {

/**
 * @brief Connect to a numeric IPv4/IPv6 address.
 *
 * @param host        numeric address, no brackets ("192.168.1.100", "::1")
 * @param port        1..65535
 * @param ipv6        address family to use
 * @param timeout_ms  bound on the connect (poll for writability)
 * @param err         errno of the failing step (ETIMEDOUT when the bound is hit,
 *                    EINVAL when @p host does not parse)
 * @return connected fd, or -1
 */
int connect_tcp(const std::string& host, uint16_t port, bool ipv6, int timeout_ms, int& err);

/// Close a socket from connect_tcp(). Negative values are ignored.
void close_tcp(int fd);

} // namespace dacwire
