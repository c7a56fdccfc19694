#pragma once
/**
 * @file errors.hpp
 * @brief Error taxonomy shared by the host layer and the front-ends.
 *
 * Nothing in dacwire throws. Host functions return bool (or a status enum) and fill an
 * Error with a kind, a stable reason token for scripts (`invalid_target:port`,
 * `connect_refused`, `write_failed`, ...) and the errno that caused it, if any.
 * Front-ends print `status=error reason=<token>` and exit with exit_code_for(kind).
 */

#include <string>

namespace dacwire {

enum class ErrorKind {
    None,
    InvalidTarget,    ///< TCP-shaped target with an unusable port
    ConnectionError,  ///< open/connect failed
    Timeout,          ///< fewer bytes than requested before the deadline (recoverable)
    WriteFailure      ///< channel error other than a timeout; the link is gone
};

struct Error {
    ErrorKind   kind{ErrorKind::None};
    std::string reason;      ///< stable token, e.g. "connect_refused"
    int         os_errno{0};

    bool ok() const { return kind == ErrorKind::None; }

    void set(ErrorKind k, const std::string& r, int e = 0) {
        kind = k;
        reason = r;
        os_errno = e;
    }
    void clear() { set(ErrorKind::None, std::string(), 0); }

    /// "reason=<token>" plus " errno=<n> (<strerror>)" when an errno is attached.
    std::string describe() const;
};

/// "none", "invalid_target", "connection_error", "timeout", "write_failure".
const char* error_kind_name(ErrorKind kind);

// Process exit codes used by every front-end.
enum : int {
    EXIT_OK             = 0,
    EXIT_CONNECTION     = 1,  ///< ConnectionError or WriteFailure
    EXIT_USAGE          = 2,  ///< bad arguments or values
    EXIT_TIMEOUT        = 3,  ///< a required response did not arrive
    EXIT_INVALID_TARGET = 4,
    EXIT_DEVICE_STATUS  = 5   ///< the device answered with a non-zero status word
};

int exit_code_for(ErrorKind kind);

/// Token for a connect/open errno: "connect_refused", "network_unreachable", "no_such_device", ...
std::string reason_for_errno(const char* prefix, int err);

} // namespace dacwire
