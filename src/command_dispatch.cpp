// -----------------------------------------------------------------------------
// Implementation for command_dispatch.hpp
//
// - See command_dispatch.hpp for the vocabulary and error strings.
// - See tests/test_dispatch.cpp for cases that exercise these builders.
//
// Focus is on local parsing, validation, and switch-based dispatch.
// No exceptions; every failure comes back as false plus a reason string.
// -----------------------------------------------------------------------------

#include "command_dispatch.hpp"
#include "dacwire/script.hpp"   // build_rs422_config()

#include <cctype>                // std::tolower
#include <cstdlib>               // strtol / strtoul

namespace dacwire {

// ---------- local parsing helpers (no exceptions) ----------
// strtol/strtoul with base 0, so "4096", "0x1000" and "010000" all work.
// Leftover characters or out-of-range values fail.

static bool parse_u8(const std::string& s, uint8_t& out,
                     uint32_t lo=0, uint32_t hi=255) {
    if (s.empty()) return false;
    char* e = nullptr;
    long v = std::strtol(s.c_str(), &e, 0);
    if (!e || *e) return false;
    if (v < (long)lo || v > (long)hi) return false;
    out = (uint8_t)v;
    return true;
}

static bool parse_u16(const std::string& s, uint16_t& out,
                      uint32_t lo=0, uint32_t hi=65535) {
    if (s.empty()) return false;
    char* e = nullptr;
    long v = std::strtol(s.c_str(), &e, 0);
    if (!e || *e) return false;
    if (v < (long)lo || v > (long)hi) return false;
    out = (uint16_t)v;
    return true;
}

static bool parse_u32(const std::string& s, uint32_t& out) {
    if (s.empty() || s[0] == '-') return false;
    char* e = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &e, 0);
    if (!e || *e) return false;
    if (v > 0xFFFFFFFFull) return false;
    out = (uint32_t)v;
    return true;
}

static bool parse_state(const std::string& s, bool& out) {
    if (s == "on"  || s == "1" || s == "true")  { out = true;  return true; }
    if (s == "off" || s == "0" || s == "false") { out = false; return true; }
    return false;
}

// ---------- lowercase normalizer ----------
static std::string lower(std::string s) {
    for (auto& c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

// ---------- mapping: word -> Verb ----------
// Explicit branches rather than a table; the vocabulary is small and fixed.
bool name_to_verb(const std::string& raw_name, Verb& out) {
    const std::string name = lower(raw_name);

    if (name == "dac")                        { out = Verb::DAC;       return true; }
    if (name == "attach" || name == "bind")   { out = Verb::ATTACH;    return true; }
    if (name == "table")                      { out = Verb::TABLE;     return true; }
    if (name == "offset")                     { out = Verb::OFFSET;    return true; }
    if (name == "gpio")                       { out = Verb::GPIO;      return true; }
    if (name == "keepalive" || name == "ka")  { out = Verb::KEEPALIVE; return true; }
    if (name == "ldac")                       { out = Verb::LDAC;      return true; }
    if (name == "register" || name == "reg")  { out = Verb::REGISTER;  return true; }
    if (name == "rs422")                      { out = Verb::RS422;     return true; }
    return false;
}

std::size_t verb_arity(Verb v) {
    switch (v) {
        case Verb::DAC:       return 2;
        case Verb::ATTACH:    return 2;
        case Verb::TABLE:     return 3;
        case Verb::OFFSET:    return 1;
        case Verb::GPIO:      return 2;
        case Verb::KEEPALIVE: return 0;
        case Verb::LDAC:      return 0;
        case Verb::REGISTER:  return 2;
        case Verb::RS422:     return 1;
    }
    return 0;
}

const char* verb_name(Verb v) {
    switch (v) {
        case Verb::DAC:       return "dac";
        case Verb::ATTACH:    return "attach";
        case Verb::TABLE:     return "table";
        case Verb::OFFSET:    return "offset";
        case Verb::GPIO:      return "gpio";
        case Verb::KEEPALIVE: return "keepalive";
        case Verb::LDAC:      return "ldac";
        case Verb::REGISTER:  return "register";
        case Verb::RS422:     return "rs422";
    }
    return "unknown";
}

// ---------- Verb -> Command(s) ----------
// Every branch parses, validates, then calls exactly one builder.
bool build_commands(Verb verb, const std::vector<std::string>& v,
                    std::vector<Command>& out, std::string& err) {
    if (v.size() != verb_arity(verb)) {
        err = std::string("bad_arity:") + verb_name(verb) + "(" + std::to_string(verb_arity(verb)) + ")";
        return false;
    }

    uint8_t a = 0, b = 0;
    uint16_t value = 0;
    bool state = false;
    Command c;

    switch (verb) {
        case Verb::DAC:
            if (!parse_u8(v[0], a, 0, DAC_CHANNELS - 1)) { err = "bad_value:channel(0..7)"; return false; }
            if (!parse_u16(v[1], value))                  { err = "bad_value:value(0..65535)"; return false; }
            if (!make_dac_write(a, value, c))             { err = "bad_value:channel(0..7)"; return false; }
            out.push_back(c);
            return true;

        case Verb::ATTACH:
            if (!parse_u8(v[0], a, 0, DAC_CHANNELS - 1)) { err = "bad_value:channel(0..7)"; return false; }
            if (!parse_u8(v[1], b, 0, TABLE_COUNT - 1))   { err = "bad_value:table(0..3)"; return false; }
            if (!make_attach_table(a, b, c))              { err = "bad_value:table(0..3)"; return false; }
            out.push_back(c);
            return true;

        case Verb::TABLE:
            if (!parse_u8(v[0], a, 0, TABLE_COUNT - 1))   { err = "bad_value:table(0..3)"; return false; }
            if (!parse_u8(v[1], b))                       { err = "bad_value:index(0..255)"; return false; }
            if (!parse_u16(v[2], value))                  { err = "bad_value:value(0..65535)"; return false; }
            if (!make_table_write(a, b, value, c))        { err = "bad_value:table(0..3)"; return false; }
            out.push_back(c);
            return true;

        case Verb::OFFSET:
            if (!parse_u8(v[0], a))                       { err = "bad_value:offset(0..255)"; return false; }
            out.push_back(make_use_table_offset(a));
            return true;

        case Verb::GPIO:
            if (!parse_u8(v[0], a, 0, GPIO_PINS - 1))     { err = "bad_value:pin(0..7)"; return false; }
            if (!parse_state(lower(v[1]), state))         { err = "bad_value:state(on|off)"; return false; }
            if (!make_gpio_set(a, state, c))              { err = "bad_value:pin(0..7)"; return false; }
            out.push_back(c);
            return true;

        case Verb::KEEPALIVE:
            out.push_back(make_keepalive());
            return true;

        case Verb::LDAC:
            out.push_back(make_ldac());
            return true;

        case Verb::REGISTER:
            if (!parse_u8(v[0], a))                       { err = "bad_value:register(0..255)"; return false; }
            if (!parse_u16(v[1], value))                  { err = "bad_value:value(0..65535)"; return false; }
            out.push_back(make_register_write(a, value));
            return true;

        case Verb::RS422: {
            uint32_t speed = 0;
            if (!parse_u32(v[0], speed) || speed == 0)    { err = "bad_value:speed(1..4294967295)"; return false; }
            etl::vector<Command, 2> pair;
            if (!build_rs422_config(speed, pair))         { err = "internal:rs422"; return false; }
            out.insert(out.end(), pair.begin(), pair.end());
            return true;
        }
    }

    err = "unhandled_command";
    return false;
}

bool build_from_tokens(const std::vector<std::string>& tokens,
                       std::vector<Command>& out, std::string& err) {
    if (tokens.empty()) { err = "empty_command"; return false; }

    Verb verb;
    if (!name_to_verb(tokens[0], verb)) {
        err = "unknown_command:" + tokens[0];
        return false;
    }
    std::vector<std::string> values(tokens.begin() + 1, tokens.end());
    return build_commands(verb, values, out, err);
}

} // namespace dacwire
