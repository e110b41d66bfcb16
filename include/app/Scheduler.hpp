#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include "app/Alerts.hpp"
#include "app/Classifier.hpp"
#include "app/EventLog.hpp"
#include "app/HistoryStore.hpp"
#include "probes/IProber.hpp"

namespace netstatus::app {

struct SchedulerOptions {
  std::string gateway{"192.168.0.1"};
  std::string internet_host{"8.8.8.8"};
  std::chrono::milliseconds interval{std::chrono::seconds(30)};
  AnomalyPolicy anomaly_policy{AnomalyPolicy::GatewayDown};
};

// The single writer of the history. Each tick probes the gateway and the
// internet host, records the result and reports state transitions.
class Scheduler {
public:
  Scheduler(HistoryStore& history, probes::IProber& prober, INotifier& notifier,
            IEventLog& log, SchedulerOptions opts = {});
  ~Scheduler();
  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  void start();
  // Wakes the interval wait and joins; an in-flight tick runs to completion.
  void stop();

  // One probe round stamped `now`. Not to be called while the loop is running.
  model::CheckRecord tick(model::Clock::time_point now);
  model::CheckRecord tick() { return tick(model::Clock::now()); }

  // State of the most recent tick; Unknown before the first one.
  model::ConnectivityState last_state() const { return last_state_.load(std::memory_order_acquire); }
  uint64_t ticks() const { return ticks_.load(std::memory_order_relaxed); }
  const SchedulerOptions& options() const { return opts_; }

private:
  void run(std::stop_token st);
  void record_line(const model::CheckRecord& rec);
  void on_transition(const model::StateChange& change);

  HistoryStore& history_;
  probes::IProber& prober_;
  INotifier& notifier_;
  IEventLog& log_;
  SchedulerOptions opts_;
  AlertEngine alerts_;
  std::atomic<model::ConnectivityState> last_state_{model::ConnectivityState::Unknown};
  std::atomic<uint64_t> ticks_{0};
  std::mutex wait_mu_;
  std::condition_variable_any wake_;
  std::jthread thread_{};
};

} // namespace netstatus::app
