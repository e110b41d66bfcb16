#include "app/Scheduler.hpp"
#include <cstdio>
#include <exception>

using namespace std::chrono;

namespace netstatus::app {

using model::ConnectivityState;

namespace {

std::string describe(const char* label, bool reachable, const std::optional<double>& ms) {
  std::string s = label;
  if (!reachable) return s + "=down";
  s += "=up";
  if (ms) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), " (%.1f ms)", *ms);
    s += buf;
  }
  return s;
}

} // namespace

Scheduler::Scheduler(HistoryStore& history, probes::IProber& prober, INotifier& notifier,
                     IEventLog& log, SchedulerOptions opts)
    : history_(history), prober_(prober), notifier_(notifier), log_(log), opts_(std::move(opts)),
      alerts_(AlertTargets{opts_.gateway, opts_.internet_host}) {
  if (opts_.interval < milliseconds(1)) opts_.interval = milliseconds(1);
}

Scheduler::~Scheduler() { stop(); }

void Scheduler::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Scheduler::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  wake_.notify_all();
  thread_.join();
}

model::CheckRecord Scheduler::tick(model::Clock::time_point now) {
  auto gw = prober_.probe(opts_.gateway);
  auto inet = prober_.probe(opts_.internet_host);

  model::CheckRecord rec;
  rec.timestamp = now;
  // Wall clock stepped back (NTP, manual change): keep the history ordered
  if (auto prev = history_.latest(); prev && rec.timestamp < prev->timestamp) {
    rec.timestamp = prev->timestamp;
  }
  rec.gateway_reachable = gw.reachable;
  rec.internet_reachable = inet.reachable;
  if (gw.reachable) rec.gateway_latency_ms = gw.latency_ms;
  if (inet.reachable) rec.internet_latency_ms = inet.latency_ms;
  rec.state = classify(rec.gateway_reachable, rec.internet_reachable, opts_.anomaly_policy);

  history_.append(rec);
  ticks_.fetch_add(1, std::memory_order_relaxed);

  record_line(rec);

  auto prev = last_state_.exchange(rec.state, std::memory_order_acq_rel);
  if (prev != rec.state) on_transition(model::StateChange{prev, rec.state, rec.timestamp});
  return rec;
}

void Scheduler::record_line(const model::CheckRecord& rec) {
  std::string msg = describe("gateway", rec.gateway_reachable, rec.gateway_latency_ms) + " " +
                    describe("internet", rec.internet_reachable, rec.internet_latency_ms) +
                    " state=" + model::to_string(rec.state);
  try {
    log_.append_line(rec.state == ConnectivityState::Up ? LogLevel::Info : LogLevel::Warning,
                     msg, rec.timestamp);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "netstatus: scheduler: event log write failed: %s\n", e.what());
  }
}

void Scheduler::on_transition(const model::StateChange& change) {
  auto alert = alerts_.evaluate(change);
  try {
    std::string msg = std::string("state change ") + model::to_string(change.previous) + " -> " +
                      model::to_string(change.current);
    log_.append_line(LogLevel::Info, msg, change.timestamp);
    if (alert) {
      log_.append_line(alert->severity == "crit" ? LogLevel::Error : LogLevel::Info,
                       alert->message, change.timestamp);
    }
  } catch (const std::exception& e) {
    std::fprintf(stderr, "netstatus: scheduler: event log write failed: %s\n", e.what());
  }
  if (!alert) return;
  try {
    notifier_.notify(change);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "netstatus: scheduler: notification failed: %s\n", e.what());
    try {
      log_.append_line(LogLevel::Error, std::string("Failed to send alert: ") + e.what(), change.timestamp);
    } catch (const std::exception&) {
      // log already reported on stderr above
    }
  }
}

void Scheduler::run(std::stop_token st) {
  std::fprintf(stderr, "netstatus: scheduler: probing %s and %s every %lldms via %s\n",
               opts_.gateway.c_str(), opts_.internet_host.c_str(),
               static_cast<long long>(opts_.interval.count()), prober_.name());
  while (!st.stop_requested()) {
    auto started = steady_clock::now();
    try {
      (void)tick();
    } catch (const std::exception& e) {
      // Contained to this tick; the loop carries on at the next interval
      std::fprintf(stderr, "netstatus: scheduler: tick failed: %s\n", e.what());
    }
    std::unique_lock lk(wait_mu_);
    (void)wake_.wait_until(lk, st, started + opts_.interval, []{ return false; });
  }
}

} // namespace netstatus::app
