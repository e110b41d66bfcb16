#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "app/Scheduler.hpp"
#include "app/SmtpNotifier.hpp"
#include "probes/IProber.hpp"

namespace netstatus::app {

// Everything read once at start-up. Nothing is hot-reloaded.
struct Config {
  SchedulerOptions schedule{};
  std::chrono::milliseconds probe_timeout{2000};
  probes::ProbeMethod probe_method{probes::ProbeMethod::Auto};
  size_t history_capacity{500};
  std::string log_file{"network_monitor.log"};
  uint16_t http_port{5000}; // 0 disables the web server
  size_t recent_rows{50};
  bool email_enabled{false};
  SmtpSettings smtp{};
};

// Environment variable helpers (NETSTATUS_FOO or netstatus_FOO)
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

// $XDG_CONFIG_HOME/netstatus/config.toml, else ~/.config/netstatus/config.toml
std::string config_file_path();

// Compiled defaults, overridden per key by the TOML file, else by NETSTATUS_*
// environment variables. An explicit path that cannot be read is an error
// (nullopt); a missing default file is not.
[[nodiscard]] std::optional<Config> load_config(const std::string& explicit_path = {});

// Clamp numeric settings into supported ranges
void sanitize(Config& cfg);

// Flags from argv; unset optionals leave the loaded config alone
struct CommandLine {
  std::string config_path;
  std::optional<uint16_t> port;
  std::optional<int> interval_seconds;
  bool once{false};
  bool help{false};
};

// The whole of `s` as a non-negative decimal int; nullopt for "", "80abc", "-1"
[[nodiscard]] std::optional<int> parse_non_negative(std::string_view s);

// nullopt, with the reason on stderr, for unknown flags and missing or bad values
[[nodiscard]] std::optional<CommandLine> parse_command_line(int argc, const char* const* argv);

// Flags override file and environment; sanitize() runs afterwards
void apply_command_line(Config& cfg, const CommandLine& cl);

} // namespace netstatus::app
