#include "app/Alerts.hpp"
#include "util/TimeFormat.hpp"

namespace netstatus::app {

using model::ConnectivityState;

AlertEngine::AlertEngine(AlertTargets targets) : targets_(std::move(targets)) {}

std::optional<Alert> AlertEngine::evaluate(const model::StateChange& c) const {
  if (c.previous == c.current) return std::nullopt;
  const std::string ts = "[" + netstatus::util::format_local(c.timestamp) + "] ";
  switch (c.current) {
    case ConnectivityState::GatewayDown:
      return Alert{"crit", ts + "ALERT: Router/Gateway (" + targets_.gateway + ") is DOWN."};
    case ConnectivityState::InternetDown:
      return Alert{"crit", ts + "ALERT: Internet is DOWN (router OK, but cannot reach " +
                           targets_.internet_host + ")."};
    case ConnectivityState::Up:
      // First check after start-up finding a healthy network is not a recovery
      if (c.previous == ConnectivityState::Unknown) return std::nullopt;
      return Alert{"info", ts + "INFO: Connectivity RESTORED (state: UP)."};
    case ConnectivityState::Unknown:
      break;
  }
  return std::nullopt;
}

} // namespace netstatus::app
