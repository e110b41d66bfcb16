#include "app/Classifier.hpp"
#include "util/AsciiLower.hpp"
#include <string>

namespace netstatus::model {

const char* to_string(ConnectivityState s) {
  switch (s) {
    case ConnectivityState::Up:           return "UP";
    case ConnectivityState::GatewayDown:  return "GATEWAY_DOWN";
    case ConnectivityState::InternetDown: return "INTERNET_DOWN";
    case ConnectivityState::Unknown:      break;
  }
  return "UNKNOWN";
}

} // namespace netstatus::model

namespace netstatus::app {

using model::ConnectivityState;

ConnectivityState classify(bool gateway_reachable, bool internet_reachable, AnomalyPolicy policy) {
  if (gateway_reachable) {
    return internet_reachable ? ConnectivityState::Up : ConnectivityState::InternetDown;
  }
  if (internet_reachable && policy == AnomalyPolicy::Up) return ConnectivityState::Up;
  return ConnectivityState::GatewayDown;
}

std::optional<AnomalyPolicy> parse_anomaly_policy(std::string_view s) {
  std::string v(s);
  for (auto& c : v) c = netstatus::util::ascii_lower(static_cast<unsigned char>(c));
  if (v == "gateway_down" || v == "gateway-down") return AnomalyPolicy::GatewayDown;
  if (v == "up") return AnomalyPolicy::Up;
  return std::nullopt;
}

} // namespace netstatus::app
