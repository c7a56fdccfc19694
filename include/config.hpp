#pragma once
/**
 * @page dw-config dacwire Tool Configuration
 * @file config.hpp
 * @brief Effective settings for a tool run: JSON file first, command line on top.
 *
 * @details
 * LAYERING
 * --------
 *   1. built-in defaults (ToolConfig member initializers)
 *   2. `--config file.json`, if given (unknown keys ignored, wrong types rejected)
 *   3. explicit command-line options (CLI11, see tool_common.hpp)
 *
 * JSON KEYS
 * ---------
 *   rate                 number  Hz for scripted loops (0 = as fast as the link allows)
 *   read_timeout_ms      int     0 = serial 100 / TCP 200
 *   write_timeout_ms     int
 *   connect_timeout_ms   int
 *   keepalive_interval_s number  0 disables periodic keepalives, at most 3600
 *   step                 int     1..65535, panel arrow-key step
 *   verbose, no_responses, no_color   bool
 *   response_commands    string "0xfe,0xfd" | "all", or array of ints
 *   command_delay_ms     int
 *   duration_s           number  0 = run until interrupted, at most 30 days
 *   baud, boot_delay_ms  int     serial only
 *
 * Failures use the reason `bad_config:<key>` (or `bad_config:parse`, `bad_config:open`),
 * ready for a `status=error reason=...` line.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "session.hpp"
#include "transport_factory.hpp"

namespace dacwire {

static constexpr double MAX_KEEPALIVE_INTERVAL_S = 3600.0;      ///< one hour
static constexpr double MAX_DURATION_S           = 30.0 * 86400; ///< thirty days

struct ToolConfig {
    double      rate_hz{10.0};
    uint32_t    read_timeout_ms{0};
    uint32_t    write_timeout_ms{WRITE_TIMEOUT_MS};
    uint32_t    connect_timeout_ms{CONNECT_TIMEOUT_MS};
    double      keepalive_interval_s{5.0};
    uint16_t    step{256};
    bool        verbose{false};
    bool        no_responses{false};
    bool        no_color{false};
    std::string response_commands;      ///< raw filter text; empty = tool default
    uint32_t    command_delay_ms{0};
    double      duration_s{0.0};
    int         baud{115200};
    int         boot_delay_ms{0};
};

/// Merge a parsed JSON object into @p cfg.
bool apply_config_json(const nlohmann::json& j, ToolConfig& cfg, std::string& err);

/// Read and merge a JSON file.
bool load_config_file(const std::string& path, ToolConfig& cfg, std::string& err);

/// Effective configuration, same keys as the file format.
nlohmann::json config_to_json(const ToolConfig& cfg);

/**
 * @brief Parse "0xfe,0xfd,252" into opcodes.
 *
 * Entries are trimmed; "0x"/"0X" means hex, otherwise decimal. "all" yields an empty
 * list (read after every frame). Fails with "bad_value:response_commands".
 */
bool parse_opcode_list(const std::string& text, std::vector<uint8_t>& out, std::string& err);

/// Per-link settings for open_transport().
LinkConfig to_link_config(const ToolConfig& cfg);

/**
 * @brief Session settings.
 * @param default_filter  opcodes to read after when the config leaves response_commands
 *                        empty (empty vector = every frame)
 */
bool to_session_config(const ToolConfig& cfg, const std::vector<uint8_t>& default_filter,
                       SessionConfig& out, std::string& err);

/// Milliseconds between scripted frames for rate_hz (0 when rate_hz <= 0).
uint32_t rate_period_ms(double rate_hz);

/// Seconds to rounded milliseconds, clamped to the uint32_t range (negative gives 0).
uint32_t seconds_to_ms(double seconds);

} // namespace dacwire
