#pragma once
/**
 * @file tool_common.hpp
 * @brief Pieces every dacwire front-end shares: common CLI11 options, config preload,
 *        connect-and-wrap, interrupt flag, error reporting.
 *
 * Typical main():
 * @code
 *   dacwire::ToolConfig cfg;
 *   std::string cfg_err;
 *   if (!dacwire::preload_config(argc, argv, cfg, cfg_err)) return dacwire::report_usage(cfg_err);
 *
 *   CLI::App app{"..."};
 *   dacwire::CommonOptions common;
 *   dacwire::add_common_options(app, cfg, common);
 *   ...
 *   CLI11_PARSE(app, argc, argv);
 *
 *   dacwire::install_signal_handlers();
 *   dacwire::Logger log(cfg.verbose, dacwire::use_color(cfg));
 *   std::unique_ptr<dacwire::Session> s;
 *   dacwire::Error err;
 *   if (!dacwire::connect_session(target, cfg, {}, log, s, err)) return dacwire::report_error(err);
 * @endcode
 */

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "CLI/CLI.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "session.hpp"
#include "target.hpp"

namespace dacwire {

struct CommonOptions {
    std::string config_path;
    bool        dump_config{false};
};

/**
 * @brief Register the shared options on @p app, bound directly to @p cfg.
 *
 * Because CLI11 only writes options that were given, values preloaded from --config stay
 * in place unless the command line overrides them.
 */
void add_common_options(CLI::App& app, ToolConfig& cfg, CommonOptions& common);

/// Find `--config <path>` / `--config=<path>` in argv and merge that file into @p cfg.
bool preload_config(int argc, char** argv, ToolConfig& cfg, std::string& err);

/// Colour only on a terminal and without --no-color.
bool use_color(const ToolConfig& cfg);

// ---- interrupt handling ----

/// SIGINT/SIGTERM set the stop flag; SIGPIPE is ignored (sockets report EPIPE instead).
void install_signal_handlers();
bool stop_requested();
void request_stop();

/// Sleep up to @p ms, waking early when a stop is requested.
void sleep_ms(uint32_t ms);

// ---- connect ----

/**
 * @brief resolve_target() + open_transport() + Session.
 *
 * Prints "Connected via <Serial|TCP> (<target>)" on success.
 * @param default_filter  response filter when the config does not set one
 */
bool connect_session(const std::string& target_text, const ToolConfig& cfg,
                     const std::vector<uint8_t>& default_filter, Logger& log,
                     std::unique_ptr<Session>& out, Error& err);

// ---- reporting ----

/// `status=error <describe()>` on stderr; returns exit_code_for(err.kind).
int report_error(const Error& err);

/// `status=error reason=<reason>` on stderr; returns EXIT_USAGE.
int report_usage(const std::string& reason);

} // namespace dacwire
