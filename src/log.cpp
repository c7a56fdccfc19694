#include "log.hpp"

#include <cstdio>     // fileno
#include <unistd.h>   // isatty

namespace dacwire {

bool stdout_is_tty() { return ::isatty(fileno(stdout)); }

std::string to_hex(const uint8_t* data, std::size_t len) {
    static const char DIGITS[] = "0123456789abcdef";
    std::string s;
    if (!data) return s;
    s.reserve(len * 3);
    for (std::size_t i = 0; i < len; ++i) {
        if (i) s += ' ';
        s += DIGITS[(data[i] >> 4) & 0x0F];
        s += DIGITS[data[i] & 0x0F];
    }
    return s;
}

std::string hex16(uint16_t v) {
    static const char DIGITS[] = "0123456789ABCDEF";
    std::string s = "0x";
    for (int shift = 12; shift >= 0; shift -= 4) s += DIGITS[(v >> shift) & 0x0F];
    return s;
}

} // namespace dacwire
