#include "app/Config.hpp"
#include "app/EventLog.hpp"
#include "app/HistoryStore.hpp"
#include "app/Scheduler.hpp"
#include "app/SmtpNotifier.hpp"
#include "app/WebServer.hpp"
#include "probes/IProber.hpp"
#include "util/TimeFormat.hpp"

#include <curl/curl.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true); }

static void install_signal_handlers() {
  struct sigaction sa{};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  ::sigaction(SIGINT, &sa, nullptr);
  ::sigaction(SIGTERM, &sa, nullptr);
  std::signal(SIGPIPE, SIG_IGN);
}

static void print_usage() {
  std::cout << "Usage: netstatus [--config PATH] [--port N] [--interval S] [--once]\n"
               "  --config PATH   TOML config (default $XDG_CONFIG_HOME/netstatus/config.toml)\n"
               "  --port N        web dashboard port, 0 disables it (default 5000)\n"
               "  --interval S    seconds between checks (default 30)\n"
               "  --once          run a single check, print it and exit (status 0 when UP)\n"
               "  -h, --help      show this help\n";
}

int main(int argc, char** argv) {
  auto cl = netstatus::app::parse_command_line(argc, argv);
  if (!cl) {
    print_usage();
    return 2;
  }
  if (cl->help) {
    print_usage();
    return 0;
  }

  auto loaded = netstatus::app::load_config(cl->config_path);
  if (!loaded) return 2;
  netstatus::app::Config cfg = *loaded;
  netstatus::app::apply_command_line(cfg, *cl);
  netstatus::app::sanitize(cfg);

  if (cfg.email_enabled && curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    std::fprintf(stderr, "netstatus: curl_global_init failed; email alerts disabled\n");
    cfg.email_enabled = false;
  }

  netstatus::app::HistoryStore history(cfg.history_capacity);
  auto prober = netstatus::probes::make_prober(cfg.probe_method, cfg.probe_timeout);
  netstatus::app::FileEventLog log(cfg.log_file);

  std::unique_ptr<netstatus::app::INotifier> notifier;
  if (cfg.email_enabled) {
    notifier = std::make_unique<netstatus::app::SmtpNotifier>(
        cfg.smtp, netstatus::app::AlertEngine({cfg.schedule.gateway, cfg.schedule.internet_host}));
  } else {
    notifier = std::make_unique<netstatus::app::NullNotifier>();
  }

  netstatus::app::Scheduler scheduler(history, *prober, *notifier, log, cfg.schedule);

  if (cl->once) {
    auto rec = scheduler.tick();
    std::cout << netstatus::util::format_local(rec.timestamp)
              << " gateway=" << (rec.gateway_reachable ? "up" : "down")
              << " internet=" << (rec.internet_reachable ? "up" : "down")
              << " state=" << netstatus::model::to_string(rec.state) << "\n";
    if (cfg.email_enabled) curl_global_cleanup();
    return rec.state == netstatus::model::ConnectivityState::Up ? 0 : 1;
  }

  install_signal_handlers();

  netstatus::app::WebOptions web_opts;
  web_opts.port = cfg.http_port;
  web_opts.recent_rows = cfg.recent_rows;
  web_opts.page = {cfg.schedule.gateway, cfg.schedule.internet_host,
                   static_cast<long long>(std::chrono::duration_cast<std::chrono::seconds>(cfg.schedule.interval).count())};
  netstatus::app::WebServer web(history, web_opts);

  log.append_line(netstatus::app::LogLevel::Info, "Monitor starting.", netstatus::model::Clock::now());
  scheduler.start();
  if (cfg.http_port != 0) web.start();

  while (!g_stop.load()) std::this_thread::sleep_for(200ms);

  std::fprintf(stderr, "netstatus: shutting down\n");
  web.stop();
  scheduler.stop();
  log.append_line(netstatus::app::LogLevel::Info, "Monitor stopped.", netstatus::model::Clock::now());
  if (cfg.email_enabled) curl_global_cleanup();
  return 0;
}
