#pragma once
#include "model/CheckRecord.hpp"
#include <optional>
#include <string>

namespace netstatus::app {

struct Alert {
  std::string severity; // info|crit
  std::string message;
};

// Hosts named in alert text
struct AlertTargets {
  std::string gateway;
  std::string internet_host;
};

class AlertEngine {
public:
  explicit AlertEngine(AlertTargets targets = {});
  // Returns the alert for a transition, or nullopt when the transition is not
  // worth reporting (no change, or start-up straight into UP).
  [[nodiscard]] std::optional<Alert> evaluate(const model::StateChange& change) const;
private:
  AlertTargets targets_;
};

// Receives state transitions. Implementations may throw on transport errors;
// the scheduler contains them.
class INotifier {
public:
  virtual ~INotifier() = default;
  virtual void notify(const model::StateChange& change) = 0;
};

class NullNotifier : public INotifier {
public:
  void notify(const model::StateChange&) override {}
};

} // namespace netstatus::app
