#include "errors.hpp"

#include <cerrno>
#include <cstring>   // strerror

namespace dacwire {

std::string Error::describe() const {
    std::string s = "reason=" + (reason.empty() ? std::string(error_kind_name(kind)) : reason);
    if (os_errno != 0) {
        s += " errno=" + std::to_string(os_errno);
        s += " (";
        s += std::strerror(os_errno);
        s += ")";
    }
    return s;
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:            return "none";
        case ErrorKind::InvalidTarget:   return "invalid_target";
        case ErrorKind::ConnectionError: return "connection_error";
        case ErrorKind::Timeout:         return "timeout";
        case ErrorKind::WriteFailure:    return "write_failure";
    }
    return "unknown";
}

int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:            return EXIT_OK;
        case ErrorKind::InvalidTarget:   return EXIT_INVALID_TARGET;
        case ErrorKind::ConnectionError: return EXIT_CONNECTION;
        case ErrorKind::Timeout:         return EXIT_TIMEOUT;
        case ErrorKind::WriteFailure:    return EXIT_CONNECTION;
    }
    return EXIT_CONNECTION;
}

// ---------------------------------------------------------------------------
// reason_for_errno()
// ------------------
// Folds the errno values a user can act on into short tokens. Anything else
// keeps the prefix alone; the numeric errno still travels in Error::os_errno.
// ---------------------------------------------------------------------------
std::string reason_for_errno(const char* prefix, int err) {
    const char* tail = nullptr;
    switch (err) {
        case ECONNREFUSED: tail = "refused";             break;
        case ENETUNREACH:  tail = "network_unreachable"; break;
        case EHOSTUNREACH: tail = "host_unreachable";    break;
        case ETIMEDOUT:    tail = "timeout";             break;
        case ENOENT:       tail = "no_such_device";      break;
        case ENODEV:
        case ENXIO:        tail = "device_missing";      break;
        case EACCES:
        case EPERM:        tail = "permission_denied";   break;
        case EBUSY:        tail = "busy";                break;
        case EPIPE:
        case ECONNRESET:   tail = "connection_reset";    break;
        default: break;
    }
    std::string s = prefix;
    if (tail) { s += "_"; s += tail; }
    return s;
}

} // namespace dacwire
