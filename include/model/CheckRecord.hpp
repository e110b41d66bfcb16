#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netstatus::model {

enum class ConnectivityState : uint8_t { Up, GatewayDown, InternetDown, Unknown };

// Display name as used in logs, alerts and the dashboard ("UP", "GATEWAY_DOWN", ...)
[[nodiscard]] const char* to_string(ConnectivityState s);

using Clock = std::chrono::system_clock;

struct ProbeResult {
  bool reachable{false};
  std::optional<double> latency_ms; // only when reachable
};

// One completed probe round. Built once by the scheduler, never mutated after.
struct CheckRecord {
  Clock::time_point timestamp{};
  bool gateway_reachable{false};
  bool internet_reachable{false};
  std::optional<double> gateway_latency_ms;
  std::optional<double> internet_latency_ms;
  ConnectivityState state{ConnectivityState::Unknown};
};

struct AggregateStats {
  size_t total{};
  size_t up{};
  size_t gateway_down{};
  size_t internet_down{};
  double uptime_pct{}; // 0..100, one decimal
};

// Parallel, equal-length series, oldest first. Empty optional = no data point.
struct ChartSeries {
  std::vector<std::string> labels;
  std::vector<std::optional<double>> gateway_ms;
  std::vector<std::optional<double>> internet_ms;
};

struct StateChange {
  ConnectivityState previous{ConnectivityState::Unknown};
  ConnectivityState current{ConnectivityState::Unknown};
  Clock::time_point timestamp{};
};

} // namespace netstatus::model
