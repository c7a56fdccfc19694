#pragma once
/**
 * @page dw-target dacwire Target Resolver
 * @file target.hpp
 * @brief Turns the user's target string into a transport construction plan.
 *
 * @details
 * GRAMMAR
 * -------
 *   [ipv6-literal]:port   -> TcpV6      e.g. "[::1]:8080"
 *   a.b.c.d:port          -> TcpV4      e.g. "192.168.1.100:8080"
 *   anything else         -> SerialPath e.g. "/dev/ttyACM0", "COM5"
 *
 * Checked in that order. Both TCP shapes are unambiguous against device paths, so no probing
 * happens here. resolve_target() only fails (InvalidTarget) when a string has a TCP shape
 * but its port is not a decimal number in 1..65535. Everything else is accepted; a bad
 * serial path or unreachable address surfaces later as a ConnectionError.
 */

#include <cstdint>
#include <string>
#include "errors.hpp"

namespace dacwire {

enum class TargetKind { SerialPath, TcpV4, TcpV6 };

struct TransportTarget {
    TargetKind  kind{TargetKind::SerialPath};
    std::string path;      ///< SerialPath only
    std::string host;      ///< TcpV4 / TcpV6, without brackets
    uint16_t    port{0};

    bool is_tcp() const { return kind != TargetKind::SerialPath; }

    /// Canonical form: the path, "host:port" or "[host]:port".
    std::string to_string() const;
};

const char* target_kind_name(TargetKind kind);

/**
 * @brief Resolve a target string.
 * @param text  raw user input
 * @param out   filled on success
 * @param err   InvalidTarget with reason "invalid_target:port" or "invalid_target:empty"
 */
bool resolve_target(const std::string& text, TransportTarget& out, Error& err);

} // namespace dacwire
