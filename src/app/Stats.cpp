#include "app/Stats.hpp"
#include "util/TimeFormat.hpp"
#include <algorithm>
#include <cmath>

namespace netstatus::app {

using model::ConnectivityState;

model::AggregateStats aggregate(const std::vector<model::CheckRecord>& records) {
  model::AggregateStats st{};
  st.total = records.size();
  for (const auto& r : records) {
    switch (r.state) {
      case ConnectivityState::Up:           ++st.up; break;
      case ConnectivityState::GatewayDown:  ++st.gateway_down; break;
      case ConnectivityState::InternetDown: ++st.internet_down; break;
      case ConnectivityState::Unknown:      break;
    }
  }
  if (st.total > 0) {
    double pct = static_cast<double>(st.up) * 100.0 / static_cast<double>(st.total);
    st.uptime_pct = std::round(pct * 10.0) / 10.0;
  }
  return st;
}

model::ChartSeries chart_series(const std::vector<model::CheckRecord>& records) {
  model::ChartSeries cs;
  cs.labels.reserve(records.size());
  cs.gateway_ms.reserve(records.size());
  cs.internet_ms.reserve(records.size());
  for (const auto& r : records) {
    cs.labels.push_back(netstatus::util::format_local(r.timestamp));
    cs.gateway_ms.push_back(r.gateway_reachable ? r.gateway_latency_ms : std::nullopt);
    cs.internet_ms.push_back(r.internet_reachable ? r.internet_latency_ms : std::nullopt);
  }
  return cs;
}

std::vector<model::CheckRecord> recent_checks(const std::vector<model::CheckRecord>& records, size_t limit) {
  size_t n = std::min(limit, records.size());
  return {records.rbegin(), records.rbegin() + static_cast<std::ptrdiff_t>(n)};
}

DashboardView build_dashboard(const HistoryStore& history, size_t recent_limit) {
  auto snap = history.snapshot();
  DashboardView v;
  if (!snap.empty()) {
    v.latest = snap.back();
    v.current = snap.back().state;
  }
  v.stats = aggregate(snap);
  v.recent = recent_checks(snap, recent_limit);
  v.series = chart_series(snap);
  return v;
}

} // namespace netstatus::app
