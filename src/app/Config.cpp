#include "app/Config.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

namespace netstatus::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("NETSTATUS_", 0) == 0) {
    alt = std::string("netstatus_") + n.substr(10);
  } else if (n.rfind("netstatus_", 0) == 0) {
    alt = std::string("NETSTATUS_") + n.substr(10);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  std::string_view sv(v);
  int out = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
    std::fprintf(stderr, "netstatus: ignoring %s='%s' (not an integer)\n", name, v);
    return defv;
  }
  return out;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/netstatus/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/netstatus/config.toml";
  return {};
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const netstatus::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    if (const char* v = getenv_compat(env_name)) return v;
  }
  return def;
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const netstatus::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const netstatus::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

static void warn_unknown_keys(const netstatus::util::TomlReader& toml, const std::string& path) {
  static const std::pair<const char*, std::vector<std::string>> known[] = {
    {"probe",    {"gateway", "internet_host", "timeout_ms", "method", "anomaly_policy"}},
    {"schedule", {"interval_seconds", "history_capacity"}},
    {"log",      {"file"}},
    {"web",      {"port", "recent_rows"}},
    {"email",    {"enabled", "smtp_server", "smtp_port", "username", "password", "from", "to", "subject"}},
  };
  for (const auto& sec : toml.section_names()) {
    const std::vector<std::string>* keys = nullptr;
    for (const auto& [name, ks] : known) if (sec == name) keys = &ks;
    if (!keys) {
      if (!sec.empty()) {
        std::fprintf(stderr, "netstatus: config %s: unknown section [%s]\n", path.c_str(), sec.c_str());
      } else {
        for (const auto& k : toml.keys(sec))
          std::fprintf(stderr, "netstatus: config %s:%d: key %s is outside any section\n", path.c_str(),
                       toml.line_of(sec, k), k.c_str());
      }
      continue;
    }
    for (const auto& k : toml.keys(sec)) {
      if (std::find(keys->begin(), keys->end(), k) == keys->end())
        std::fprintf(stderr, "netstatus: config %s:%d: unknown key %s.%s\n", path.c_str(),
                     toml.line_of(sec, k), sec.c_str(), k.c_str());
    }
  }
}

std::optional<Config> load_config(const std::string& explicit_path) {
  netstatus::util::TomlReader toml;
  bool have_toml = false;
  std::string path = explicit_path.empty() ? config_file_path() : explicit_path;
  if (!path.empty()) {
    have_toml = toml.load(path);
    if (!have_toml && !explicit_path.empty()) {
      std::fprintf(stderr, "netstatus: cannot read config file %s\n", path.c_str());
      return std::nullopt;
    }
    if (have_toml) {
      for (const auto& p : toml.problems())
        std::fprintf(stderr, "netstatus: config %s:%d: %s\n", path.c_str(), p.line, p.message.c_str());
      warn_unknown_keys(toml, path);
    }
  }

  Config cfg{};
  auto& s = cfg.schedule;
  s.gateway = resolve_string(toml, have_toml, "probe", "gateway", "NETSTATUS_GATEWAY", s.gateway);
  s.internet_host = resolve_string(toml, have_toml, "probe", "internet_host", "NETSTATUS_INTERNET_HOST", s.internet_host);
  cfg.probe_timeout = std::chrono::milliseconds(
      resolve_int(toml, have_toml, "probe", "timeout_ms", "NETSTATUS_TIMEOUT_MS",
                  static_cast<int>(cfg.probe_timeout.count())));
  cfg.probe_method = probes::parse_probe_method(
      resolve_string(toml, have_toml, "probe", "method", "NETSTATUS_PROBE_METHOD", "auto"));
  {
    auto pol = resolve_string(toml, have_toml, "probe", "anomaly_policy", "NETSTATUS_ANOMALY_POLICY", "gateway_down");
    if (auto p = parse_anomaly_policy(pol)) {
      s.anomaly_policy = *p;
    } else {
      std::fprintf(stderr, "netstatus: unknown anomaly_policy '%s', using gateway_down\n", pol.c_str());
    }
  }

  s.interval = std::chrono::seconds(
      resolve_int(toml, have_toml, "schedule", "interval_seconds", "NETSTATUS_INTERVAL_SECONDS", 30));
  cfg.history_capacity = static_cast<size_t>(std::max(1,
      resolve_int(toml, have_toml, "schedule", "history_capacity", "NETSTATUS_HISTORY_CAPACITY",
                  static_cast<int>(cfg.history_capacity))));

  cfg.log_file = resolve_string(toml, have_toml, "log", "file", "NETSTATUS_LOG_FILE", cfg.log_file);

  cfg.http_port = static_cast<uint16_t>(std::clamp(
      resolve_int(toml, have_toml, "web", "port", "NETSTATUS_PORT", cfg.http_port), 0, 65535));
  cfg.recent_rows = static_cast<size_t>(std::max(1,
      resolve_int(toml, have_toml, "web", "recent_rows", "NETSTATUS_RECENT_ROWS",
                  static_cast<int>(cfg.recent_rows))));

  cfg.email_enabled = resolve_bool(toml, have_toml, "email", "enabled", "NETSTATUS_EMAIL_ENABLED", false);
  auto& m = cfg.smtp;
  m.server = resolve_string(toml, have_toml, "email", "smtp_server", "NETSTATUS_SMTP_SERVER", m.server);
  m.port = resolve_int(toml, have_toml, "email", "smtp_port", "NETSTATUS_SMTP_PORT", m.port);
  m.username = resolve_string(toml, have_toml, "email", "username", "NETSTATUS_SMTP_USERNAME", m.username);
  m.password = resolve_string(toml, have_toml, "email", "password", "NETSTATUS_SMTP_PASSWORD", m.password);
  m.from = resolve_string(toml, have_toml, "email", "from", "NETSTATUS_EMAIL_FROM", m.from);
  m.to = resolve_string(toml, have_toml, "email", "to", "NETSTATUS_EMAIL_TO", m.to);
  m.subject = resolve_string(toml, have_toml, "email", "subject", "NETSTATUS_EMAIL_SUBJECT", m.subject);

  sanitize(cfg);
  return cfg;
}

void sanitize(Config& cfg) {
  using namespace std::chrono;
  cfg.schedule.interval = std::clamp<milliseconds>(cfg.schedule.interval, seconds(1), hours(24));
  cfg.probe_timeout = std::clamp<milliseconds>(cfg.probe_timeout, milliseconds(100), seconds(30));
  cfg.history_capacity = std::clamp<size_t>(cfg.history_capacity, 1, 100000);
  cfg.recent_rows = std::clamp<size_t>(cfg.recent_rows, 1, 50);
  cfg.smtp.port = std::clamp(cfg.smtp.port, 1, 65535);
  if (cfg.email_enabled && cfg.smtp.to.empty()) {
    std::fprintf(stderr, "netstatus: email enabled but no recipient configured; disabling alerts\n");
    cfg.email_enabled = false;
  }
}

std::optional<int> parse_non_negative(std::string_view s) {
  int v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size() || v < 0) return std::nullopt;
  return v;
}

std::optional<CommandLine> parse_command_line(int argc, const char* const* argv) {
  CommandLine cl;
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    auto value = [&](std::string_view flag) -> const char* {
      if (i + 1 >= argc) {
        std::fprintf(stderr, "netstatus: %.*s needs a value\n", static_cast<int>(flag.size()), flag.data());
        return nullptr;
      }
      return argv[++i];
    };
    if (a == "--config") {
      const char* v = value(a);
      if (!v) return std::nullopt;
      cl.config_path = v;
    } else if (a == "--port") {
      const char* v = value(a);
      if (!v) return std::nullopt;
      auto n = parse_non_negative(v);
      if (!n || *n > 65535) {
        std::fprintf(stderr, "netstatus: --port expects a number in 0..65535, got '%s'\n", v);
        return std::nullopt;
      }
      cl.port = static_cast<uint16_t>(*n);
    } else if (a == "--interval") {
      const char* v = value(a);
      if (!v) return std::nullopt;
      auto n = parse_non_negative(v);
      if (!n || *n == 0) {
        std::fprintf(stderr, "netstatus: --interval expects a positive number of seconds, got '%s'\n", v);
        return std::nullopt;
      }
      cl.interval_seconds = *n;
    } else if (a == "--once") {
      cl.once = true;
    } else if (a == "-h" || a == "--help") {
      cl.help = true;
    } else {
      std::fprintf(stderr, "netstatus: unknown argument '%s'\n", argv[i]);
      return std::nullopt;
    }
  }
  return cl;
}

void apply_command_line(Config& cfg, const CommandLine& cl) {
  if (cl.port) cfg.http_port = *cl.port;
  if (cl.interval_seconds) cfg.schedule.interval = std::chrono::seconds(*cl.interval_seconds);
}

} // namespace netstatus::app
