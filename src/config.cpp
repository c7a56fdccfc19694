// ============================================================================
// config.cpp - implementation for config.hpp
// ============================================================================

#include "config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>

using json = nlohmann::json;

namespace dacwire {

// ---------- typed getters ----------
// Missing keys leave the field alone. Present keys must have the right type and range.

static bool bad(std::string& err, const char* key) {
    err = std::string("bad_config:") + key;
    return false;
}

static bool get_bool(const json& j, const char* key, bool& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_boolean()) return bad(err, key);
    out = it->get<bool>();
    return true;
}

static bool get_u32(const json& j, const char* key, uint32_t& out, std::string& err,
                    uint32_t lo = 0, uint32_t hi = std::numeric_limits<uint32_t>::max()) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_number_integer()) return bad(err, key);
    if (it->is_number_unsigned()) {
        uint64_t v = it->get<uint64_t>();
        if (v < lo || v > hi) return bad(err, key);
        out = static_cast<uint32_t>(v);
        return true;
    }
    int64_t v = it->get<int64_t>();
    if (v < static_cast<int64_t>(lo) || v > static_cast<int64_t>(hi)) return bad(err, key);
    out = static_cast<uint32_t>(v);
    return true;
}

static bool get_double(const json& j, const char* key, double& out, std::string& err,
                       double hi = std::numeric_limits<double>::max()) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_number()) return bad(err, key);
    double v = it->get<double>();
    if (!(v >= 0.0 && v <= hi)) return bad(err, key);
    out = v;
    return true;
}

// ---------- public API ----------

bool apply_config_json(const json& j, ToolConfig& cfg, std::string& err) {
    if (!j.is_object()) { err = "bad_config:root"; return false; }

    uint32_t tmp = 0;

    if (!get_double(j, "rate", cfg.rate_hz, err)) return false;
    if (!get_u32(j, "read_timeout_ms", cfg.read_timeout_ms, err, 0, 600000)) return false;
    if (!get_u32(j, "write_timeout_ms", cfg.write_timeout_ms, err, 1, 600000)) return false;
    if (!get_u32(j, "connect_timeout_ms", cfg.connect_timeout_ms, err, 1, 600000)) return false;
    if (!get_double(j, "keepalive_interval_s", cfg.keepalive_interval_s, err,
                    MAX_KEEPALIVE_INTERVAL_S)) return false;

    tmp = cfg.step;
    if (!get_u32(j, "step", tmp, err, 1, 65535)) return false;
    cfg.step = static_cast<uint16_t>(tmp);

    if (!get_bool(j, "verbose", cfg.verbose, err)) return false;
    if (!get_bool(j, "no_responses", cfg.no_responses, err)) return false;
    if (!get_bool(j, "no_color", cfg.no_color, err)) return false;

    auto rc = j.find("response_commands");
    if (rc != j.end()) {
        if (rc->is_string()) {
            cfg.response_commands = rc->get<std::string>();
        } else if (rc->is_array()) {
            std::string joined;
            for (const auto& e : *rc) {
                if (!e.is_number_unsigned() || e.get<uint64_t>() > 255) return bad(err, "response_commands");
                if (!joined.empty()) joined += ",";
                joined += std::to_string(e.get<uint64_t>());
            }
            cfg.response_commands = joined.empty() ? "all" : joined;
        } else {
            return bad(err, "response_commands");
        }
        std::vector<uint8_t> check;
        if (!parse_opcode_list(cfg.response_commands, check, err)) return bad(err, "response_commands");
    }

    if (!get_u32(j, "command_delay_ms", cfg.command_delay_ms, err, 0, 60000)) return false;
    if (!get_double(j, "duration_s", cfg.duration_s, err, MAX_DURATION_S)) return false;

    tmp = static_cast<uint32_t>(cfg.baud);
    if (!get_u32(j, "baud", tmp, err, 1200, 4000000)) return false;
    cfg.baud = static_cast<int>(tmp);

    tmp = static_cast<uint32_t>(cfg.boot_delay_ms);
    if (!get_u32(j, "boot_delay_ms", tmp, err, 0, 10000)) return false;
    cfg.boot_delay_ms = static_cast<int>(tmp);

    return true;
}

bool load_config_file(const std::string& path, ToolConfig& cfg, std::string& err) {
    std::ifstream in(path);
    if (!in) { err = "bad_config:open"; return false; }

    // Non-throwing parse: a syntax error yields a discarded value.
    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) { err = "bad_config:parse"; return false; }
    return apply_config_json(j, cfg, err);
}

json config_to_json(const ToolConfig& cfg) {
    json j;
    j["rate"]                 = cfg.rate_hz;
    j["read_timeout_ms"]      = cfg.read_timeout_ms;
    j["write_timeout_ms"]     = cfg.write_timeout_ms;
    j["connect_timeout_ms"]   = cfg.connect_timeout_ms;
    j["keepalive_interval_s"] = cfg.keepalive_interval_s;
    j["step"]                 = cfg.step;
    j["verbose"]              = cfg.verbose;
    j["no_responses"]         = cfg.no_responses;
    j["no_color"]             = cfg.no_color;
    j["response_commands"]    = cfg.response_commands;
    j["command_delay_ms"]     = cfg.command_delay_ms;
    j["duration_s"]           = cfg.duration_s;
    j["baud"]                 = cfg.baud;
    j["boot_delay_ms"]        = cfg.boot_delay_ms;
    return j;
}

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool parse_opcode_list(const std::string& text, std::vector<uint8_t>& out, std::string& err) {
    out.clear();
    const std::string all = trim(text);
    if (all == "all") return true;
    if (all.empty()) { err = "bad_value:response_commands"; return false; }

    size_t start = 0;
    while (start <= all.size()) {
        size_t comma = all.find(',', start);
        std::string part = trim(all.substr(start, comma == std::string::npos ? std::string::npos : comma - start));

        int base = 10;
        std::string digits = part;
        if (part.size() > 2 && part[0] == '0' && (part[1] == 'x' || part[1] == 'X')) {
            base = 16;
            digits = part.substr(2);
        }
        if (digits.empty()) { err = "bad_value:response_commands"; out.clear(); return false; }
        char* e = nullptr;
        long v = std::strtol(digits.c_str(), &e, base);
        if (!e || *e || v < 0 || v > 255 || digits[0] == '-' || digits[0] == '+') {
            err = "bad_value:response_commands";
            out.clear();
            return false;
        }
        out.push_back(static_cast<uint8_t>(v));

        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return true;
}

LinkConfig to_link_config(const ToolConfig& cfg) {
    LinkConfig lc;
    lc.read_timeout_ms    = cfg.read_timeout_ms;
    lc.write_timeout_ms   = cfg.write_timeout_ms;
    lc.connect_timeout_ms = cfg.connect_timeout_ms;
    lc.baud               = cfg.baud;
    lc.boot_delay_ms      = cfg.boot_delay_ms;
    return lc;
}

bool to_session_config(const ToolConfig& cfg, const std::vector<uint8_t>& default_filter,
                       SessionConfig& out, std::string& err) {
    SessionConfig sc;
    sc.read_responses        = !cfg.no_responses;
    sc.command_delay_ms      = cfg.command_delay_ms;
    sc.keepalive_interval_ms = seconds_to_ms(cfg.keepalive_interval_s);

    if (cfg.response_commands.empty()) {
        sc.response_opcodes = default_filter;
    } else if (!parse_opcode_list(cfg.response_commands, sc.response_opcodes, err)) {
        return false;
    }
    out = sc;
    return true;
}

// Out-of-range double to unsigned conversion is undefined, so clamp first.
static uint32_t clamp_ms(double ms) {
    if (!(ms > 0.0)) return 0;
    const double top = static_cast<double>(std::numeric_limits<uint32_t>::max());
    return ms >= top ? std::numeric_limits<uint32_t>::max() : static_cast<uint32_t>(ms);
}

uint32_t rate_period_ms(double rate_hz) {
    if (rate_hz <= 0.0) return 0;
    return clamp_ms(1000.0 / rate_hz);
}

uint32_t seconds_to_ms(double seconds) {
    return clamp_ms(seconds * 1000.0 + 0.5);
}

} // namespace dacwire
