#include "minitest.hpp"
#include "app/Config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>

using namespace std::chrono;

static std::string tmp_config(const char* tag, const std::string& content) {
  auto p = (std::filesystem::temp_directory_path() /
            ("netstatus_test_cfg_" + std::to_string(::getpid()) + "_" + tag + ".toml")).string();
  std::ofstream f(p);
  f << content;
  return p;
}

static void remove_file(const std::string& p) {
  std::error_code ec;
  std::filesystem::remove(p, ec);
}

TEST(config_missing_explicit_file_fails) {
  ASSERT_TRUE(!netstatus::app::load_config("/nonexistent/netstatus/config.toml").has_value());
}

TEST(config_reads_toml) {
  auto p = tmp_config("full",
    "[probe]\n"
    "gateway = \"10.1.1.1\"\n"
    "internet_host = \"1.1.1.1\"\n"
    "timeout_ms = 1500\n"
    "method = \"command\"\n"
    "anomaly_policy = \"up\"\n"
    "[schedule]\n"
    "interval_seconds = 10\n"
    "history_capacity = 120\n"
    "[log]\n"
    "file = \"/tmp/netstatus-test.log\"\n"
    "[web]\n"
    "port = 8080\n"
    "recent_rows = 20\n"
    "[email]\n"
    "enabled = true\n"
    "to = \"ops@example.com\"\n"
    "smtp_port = 2525\n");
  auto cfg = netstatus::app::load_config(p);
  ASSERT_TRUE(cfg.has_value());
  ASSERT_EQ(cfg->schedule.gateway, "10.1.1.1");
  ASSERT_EQ(cfg->schedule.internet_host, "1.1.1.1");
  ASSERT_TRUE(cfg->probe_timeout == milliseconds(1500));
  ASSERT_TRUE(cfg->probe_method == netstatus::probes::ProbeMethod::Command);
  ASSERT_TRUE(cfg->schedule.anomaly_policy == netstatus::app::AnomalyPolicy::Up);
  ASSERT_TRUE(cfg->schedule.interval == seconds(10));
  ASSERT_EQ(cfg->history_capacity, 120u);
  ASSERT_EQ(cfg->log_file, "/tmp/netstatus-test.log");
  ASSERT_EQ(cfg->http_port, 8080);
  ASSERT_EQ(cfg->recent_rows, 20u);
  ASSERT_TRUE(cfg->email_enabled);
  ASSERT_EQ(cfg->smtp.to, "ops@example.com");
  ASSERT_EQ(cfg->smtp.port, 2525);
  ASSERT_EQ(cfg->smtp.server, "smtp.example.com");
  remove_file(p);
}

TEST(config_defaults_for_empty_file) {
  auto p = tmp_config("empty", "# nothing set\n");
  ::unsetenv("NETSTATUS_GATEWAY");
  ::unsetenv("NETSTATUS_PORT");
  auto cfg = netstatus::app::load_config(p);
  ASSERT_TRUE(cfg.has_value());
  ASSERT_EQ(cfg->schedule.gateway, "192.168.0.1");
  ASSERT_EQ(cfg->schedule.internet_host, "8.8.8.8");
  ASSERT_TRUE(cfg->schedule.interval == seconds(30));
  ASSERT_TRUE(cfg->probe_timeout == milliseconds(2000));
  ASSERT_EQ(cfg->history_capacity, 500u);
  ASSERT_EQ(cfg->http_port, 5000);
  ASSERT_TRUE(!cfg->email_enabled);
  remove_file(p);
}

TEST(config_env_fills_keys_missing_from_toml) {
  auto p = tmp_config("env", "[probe]\ngateway = \"10.9.9.9\"\n");
  ::setenv("NETSTATUS_GATEWAY", "10.0.0.254", 1);
  ::setenv("NETSTATUS_PORT", "9100", 1);
  auto cfg = netstatus::app::load_config(p);
  ::unsetenv("NETSTATUS_GATEWAY");
  ::unsetenv("NETSTATUS_PORT");
  ASSERT_TRUE(cfg.has_value());
  // The file wins where it has the key
  ASSERT_EQ(cfg->schedule.gateway, "10.9.9.9");
  ASSERT_EQ(cfg->http_port, 9100);
  remove_file(p);
}

TEST(config_clamps_out_of_range_values) {
  auto p = tmp_config("clamp",
    "[probe]\ntimeout_ms = 5\n"
    "[schedule]\ninterval_seconds = 0\nhistory_capacity = -3\n"
    "[web]\nrecent_rows = 100000\n");
  auto cfg = netstatus::app::load_config(p);
  ASSERT_TRUE(cfg.has_value());
  ASSERT_TRUE(cfg->probe_timeout == milliseconds(100));
  ASSERT_TRUE(cfg->schedule.interval == seconds(1));
  ASSERT_EQ(cfg->history_capacity, 1u);
  ASSERT_EQ(cfg->recent_rows, 50u);
  remove_file(p);
}

TEST(config_email_needs_recipient) {
  netstatus::app::Config cfg;
  cfg.email_enabled = true;
  netstatus::app::sanitize(cfg);
  ASSERT_TRUE(!cfg.email_enabled);
  cfg.email_enabled = true;
  cfg.smtp.to = "ops@example.com";
  netstatus::app::sanitize(cfg);
  ASSERT_TRUE(cfg.email_enabled);
}

TEST(config_unknown_policy_keeps_default) {
  auto p = tmp_config("policy", "[probe]\nanomaly_policy = \"sideways\"\n");
  auto cfg = netstatus::app::load_config(p);
  ASSERT_TRUE(cfg.has_value());
  ASSERT_TRUE(cfg->schedule.anomaly_policy == netstatus::app::AnomalyPolicy::GatewayDown);
  remove_file(p);
}

TEST(config_xdg_path) {
  const char* old = std::getenv("XDG_CONFIG_HOME");
  std::string saved = old ? old : "";
  ::setenv("XDG_CONFIG_HOME", "/tmp/xdgtest", 1);
  ASSERT_EQ(netstatus::app::config_file_path(), "/tmp/xdgtest/netstatus/config.toml");
  if (old) ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1); else ::unsetenv("XDG_CONFIG_HOME");
}

TEST(config_recent_rows_capped_at_fifty) {
  netstatus::app::Config cfg;
  cfg.recent_rows = 51;
  netstatus::app::sanitize(cfg);
  ASSERT_EQ(cfg.recent_rows, 50u);
  cfg.recent_rows = 0;
  netstatus::app::sanitize(cfg);
  ASSERT_EQ(cfg.recent_rows, 1u);
}

TEST(config_env_integer_must_be_whole) {
  ::setenv("NETSTATUS_TEST_INT", "80abc", 1);
  ASSERT_EQ(netstatus::app::getenv_int("NETSTATUS_TEST_INT", 7), 7);
  ::setenv("NETSTATUS_TEST_INT", "-12", 1);
  ASSERT_EQ(netstatus::app::getenv_int("NETSTATUS_TEST_INT", 7), -12);
  ::unsetenv("NETSTATUS_TEST_INT");
}

TEST(cli_whole_number_parsing) {
  using netstatus::app::parse_non_negative;
  ASSERT_TRUE(parse_non_negative("8080") == std::optional<int>(8080));
  ASSERT_TRUE(parse_non_negative("0") == std::optional<int>(0));
  ASSERT_FALSE(parse_non_negative("80abc").has_value());
  ASSERT_FALSE(parse_non_negative("-1").has_value());
  ASSERT_FALSE(parse_non_negative("").has_value());
  ASSERT_FALSE(parse_non_negative(" 80").has_value());
  ASSERT_FALSE(parse_non_negative("99999999999").has_value());
}

TEST(cli_flags_parse_and_apply) {
  const char* argv[] = {"netstatus", "--config", "/etc/netstatus.toml", "--port", "0",
                        "--interval", "15", "--once"};
  auto cl = netstatus::app::parse_command_line(8, argv);
  ASSERT_TRUE(cl.has_value());
  ASSERT_EQ(cl->config_path, "/etc/netstatus.toml");
  ASSERT_TRUE(cl->port == std::optional<uint16_t>(0));
  ASSERT_TRUE(cl->interval_seconds == std::optional<int>(15));
  ASSERT_TRUE(cl->once);
  ASSERT_FALSE(cl->help);

  netstatus::app::Config cfg;
  netstatus::app::apply_command_line(cfg, *cl);
  ASSERT_EQ(cfg.http_port, 0);
  ASSERT_TRUE(cfg.schedule.interval == seconds(15));
}

TEST(cli_rejects_malformed_values) {
  auto parse = [](std::initializer_list<const char*> args) {
    std::vector<const char*> argv{"netstatus"};
    argv.insert(argv.end(), args);
    return netstatus::app::parse_command_line(static_cast<int>(argv.size()), argv.data());
  };
  ASSERT_FALSE(parse({"--port", "80abc"}).has_value());
  ASSERT_FALSE(parse({"--port", "-1"}).has_value());
  ASSERT_FALSE(parse({"--port", "70000"}).has_value());
  ASSERT_FALSE(parse({"--interval", "0"}).has_value());
  ASSERT_FALSE(parse({"--interval", "1.5"}).has_value());
  ASSERT_FALSE(parse({"--port"}).has_value());
  ASSERT_FALSE(parse({"--verbose"}).has_value());
  ASSERT_TRUE(parse({"-h"})->help);
  ASSERT_TRUE(parse({}).has_value());
}

TEST(cli_without_flags_keeps_config) {
  netstatus::app::Config cfg;
  cfg.http_port = 9100;
  netstatus::app::apply_command_line(cfg, netstatus::app::CommandLine{});
  ASSERT_EQ(cfg.http_port, 9100);
  ASSERT_TRUE(cfg.schedule.interval == seconds(30));
}
