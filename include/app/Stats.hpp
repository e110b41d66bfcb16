#pragma once
#include <vector>
#include "app/HistoryStore.hpp"
#include "model/CheckRecord.hpp"

namespace netstatus::app {

// All read queries below are pure functions of a snapshot; nothing is cached.

[[nodiscard]] model::AggregateStats aggregate(const std::vector<model::CheckRecord>& records);

[[nodiscard]] model::ChartSeries chart_series(const std::vector<model::CheckRecord>& records);

// Up to `limit` records, newest first
[[nodiscard]] std::vector<model::CheckRecord> recent_checks(const std::vector<model::CheckRecord>& records,
                                                            size_t limit);

// Everything the presentation layer needs for one request, taken from a
// single snapshot so the parts agree with each other.
struct DashboardView {
  model::ConnectivityState current{model::ConnectivityState::Unknown};
  model::AggregateStats stats;
  std::vector<model::CheckRecord> recent;  // newest first
  model::ChartSeries series;               // oldest first
  std::optional<model::CheckRecord> latest;
};

inline constexpr size_t kRecentRows = 50;

[[nodiscard]] DashboardView build_dashboard(const HistoryStore& history, size_t recent_limit = kRecentRows);

} // namespace netstatus::app
