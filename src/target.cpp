#include "target.hpp"

#include <cctype>

namespace dacwire {

// ---- helpers ----

static bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    return true;
}

// 1..65535, decimal only. Long digit runs are rejected before they can overflow.
static bool parse_port(const std::string& s, uint16_t& out) {
    if (!all_digits(s) || s.size() > 5) return false;
    unsigned long v = std::stoul(s);
    if (v == 0 || v > 65535) return false;
    out = static_cast<uint16_t>(v);
    return true;
}

// Four groups of 1..3 digits separated by dots. Octet values are not range checked here:
// "999.1.1.1:80" is still TCP-shaped and fails at connect time.
static bool is_dotted_quad(const std::string& s) {
    int groups = 0;
    size_t run = 0;
    for (char c : s) {
        if (c == '.') {
            if (run == 0) return false;
            ++groups;
            run = 0;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            if (++run > 3) return false;
        } else {
            return false;
        }
    }
    return groups == 3 && run > 0;
}

// ---- public API ----

std::string TransportTarget::to_string() const {
    switch (kind) {
        case TargetKind::SerialPath: return path;
        case TargetKind::TcpV4:      return host + ":" + std::to_string(port);
        case TargetKind::TcpV6:      return "[" + host + "]:" + std::to_string(port);
    }
    return path;
}

const char* target_kind_name(TargetKind kind) {
    switch (kind) {
        case TargetKind::SerialPath: return "serial";
        case TargetKind::TcpV4:      return "tcp4";
        case TargetKind::TcpV6:      return "tcp6";
    }
    return "serial";
}

bool resolve_target(const std::string& text, TransportTarget& out, Error& err) {
    if (text.empty()) {
        err.set(ErrorKind::InvalidTarget, "invalid_target:empty");
        return false;
    }

    TransportTarget t;

    // 1) [ipv6]:port
    if (text.front() == '[') {
        size_t close = text.find(']');
        if (close != std::string::npos && close > 1 &&
            close + 1 < text.size() && text[close + 1] == ':') {
            if (!parse_port(text.substr(close + 2), t.port)) {
                err.set(ErrorKind::InvalidTarget, "invalid_target:port");
                return false;
            }
            t.kind = TargetKind::TcpV6;
            t.host = text.substr(1, close - 1);
            out = t;
            return true;
        }
    }

    // 2) a.b.c.d:port
    size_t colon = text.find(':');
    if (colon != std::string::npos && is_dotted_quad(text.substr(0, colon))) {
        if (!parse_port(text.substr(colon + 1), t.port)) {
            err.set(ErrorKind::InvalidTarget, "invalid_target:port");
            return false;
        }
        t.kind = TargetKind::TcpV4;
        t.host = text.substr(0, colon);
        out = t;
        return true;
    }

    // 3) opaque device path
    t.kind = TargetKind::SerialPath;
    t.path = text;
    out = t;
    return true;
}

} // namespace dacwire
