#pragma once
#include <optional>
#include <string_view>
#include "model/CheckRecord.hpp"

namespace netstatus::app {

// Resolution for "gateway silent, internet answers". Treated as a
// measurement anomaly by default.
enum class AnomalyPolicy { GatewayDown, Up };

[[nodiscard]] model::ConnectivityState classify(bool gateway_reachable, bool internet_reachable,
                                                AnomalyPolicy policy = AnomalyPolicy::GatewayDown);

// "gateway_down" | "up"; nullopt for anything else
[[nodiscard]] std::optional<AnomalyPolicy> parse_anomaly_policy(std::string_view s);

} // namespace netstatus::app
