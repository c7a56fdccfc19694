#pragma once
/**
 * @file log.hpp
 * @brief Console output for the tools: colour helper, levelled logger, hex dumps.
 *
 * Output stays plain iostream text. Info goes to stdout, warnings and errors to stderr,
 * debug lines only appear with --verbose. Colour is switched off when stdout is not a
 * terminal or --no-color was given, so piped output stays grep-friendly.
 */

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>

namespace dacwire {

bool stdout_is_tty();

struct Ansi {
    bool enabled{true};
    std::string bold  (const std::string& s) const { return wrap("\033[1m", s); }
    std::string dim   (const std::string& s) const { return wrap("\033[2m", s); }
    std::string red   (const std::string& s) const { return wrap("\033[31m", s); }
    std::string green (const std::string& s) const { return wrap("\033[32m", s); }
    std::string yellow(const std::string& s) const { return wrap("\033[33m", s); }
    std::string cyan  (const std::string& s) const { return wrap("\033[36m", s); }

private:
    std::string wrap(const char* code, const std::string& s) const {
        return enabled ? std::string(code) + s + "\033[0m" : s;
    }
};

class Logger {
public:
    explicit Logger(bool verbose = false, bool color = false,
                    std::ostream& out = std::cout, std::ostream& err = std::cerr)
    : verbose_(verbose), out_(out), err_(err) { ansi_.enabled = color; }

    void info (const std::string& msg) const { out_ << msg << "\n"; }
    void warn (const std::string& msg) const { err_ << ansi_.yellow("warning: ") << msg << "\n"; }
    void error(const std::string& msg) const { err_ << ansi_.red("error: ") << msg << "\n"; }
    void debug(const std::string& msg) const {
        if (verbose_) out_ << ansi_.dim("[debug] " + msg) << "\n";
    }

    bool verbose() const { return verbose_; }
    void set_verbose(bool v) { verbose_ = v; }
    const Ansi& ansi() const { return ansi_; }
    void set_color(bool c) { ansi_.enabled = c; }

    std::ostream& out() const { return out_; }
    std::ostream& err() const { return err_; }

private:
    bool          verbose_;
    Ansi          ansi_;
    std::ostream& out_;
    std::ostream& err_;
};

/// "fd 00 00 00" (lowercase, space separated).
std::string to_hex(const uint8_t* data, std::size_t len);

/// "0x1000".
std::string hex16(uint16_t v);

} // namespace dacwire
