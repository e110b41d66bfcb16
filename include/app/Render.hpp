#pragma once

#include <string>
#include "app/Stats.hpp"

namespace netstatus::app {

// Static facts about the monitor shown next to the live data
struct PageInfo {
  std::string gateway;
  std::string internet_host;
  long long interval_seconds{30};
};

// Prometheus text exposition format (version 0.0.4)
[[nodiscard]] std::string view_to_prometheus(const DashboardView& v);

// {"state":..., "stats":{...}, "latest":{...}|null, "recent":[...]}
[[nodiscard]] std::string view_to_status_json(const DashboardView& v);

// {"labels":[...], "gateway_ms":[...|null], "internet_ms":[...|null]}
[[nodiscard]] std::string series_to_json(const model::ChartSeries& cs);

// Self-contained HTML page: status, stats, SVG latency chart, recent checks
[[nodiscard]] std::string view_to_html(const DashboardView& v, const PageInfo& info);

} // namespace netstatus::app
