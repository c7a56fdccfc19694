#pragma once
/**
 * @file tcp_listener.hpp
 * @brief Server-side sockets for the simulator and the serial bridge.
 *
 * Listening sockets are non-blocking and meant to sit in a poll() set next to the client
 * sockets. An IPv6 listener is v6-only, so a tool that wants both families opens one of
 * each on the same port.
 */

#include <cstdint>
#include <string>

namespace dacwire {

/**
 * @brief Bind and listen on a numeric address.
 * @param address  "127.0.0.1", "0.0.0.0", "::", "::1", ...
 * @param port     0 picks an ephemeral port (see bound_port())
 * @param err      errno of the failing step (EINVAL for an unparsable address)
 * @return listening fd, or -1
 */
int listen_tcp(const std::string& address, uint16_t port, int& err);

/**
 * @brief Accept one pending client.
 * @param peer  receives "host:port" / "[host]:port"
 * @return non-blocking client fd with TCP_NODELAY, or -1 (nothing pending or error)
 */
int accept_client(int listen_fd, std::string& peer);

/// Local port a socket is bound to, 0 on error.
uint16_t bound_port(int fd);

void close_socket(int fd);

} // namespace dacwire
