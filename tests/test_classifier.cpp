#include "minitest.hpp"
#include "app/Classifier.hpp"
#include <string>

using netstatus::app::AnomalyPolicy;
using netstatus::app::classify;
using netstatus::model::ConnectivityState;

TEST(classify_truth_table) {
  ASSERT_TRUE(classify(true, true) == ConnectivityState::Up);
  ASSERT_TRUE(classify(true, false) == ConnectivityState::InternetDown);
  ASSERT_TRUE(classify(false, false) == ConnectivityState::GatewayDown);
  ASSERT_TRUE(classify(false, true) == ConnectivityState::GatewayDown);
}

TEST(classify_never_yields_unknown) {
  for (int g = 0; g < 2; ++g)
    for (int i = 0; i < 2; ++i)
      for (auto pol : {AnomalyPolicy::GatewayDown, AnomalyPolicy::Up})
        ASSERT_TRUE(classify(g == 1, i == 1, pol) != ConnectivityState::Unknown);
}

TEST(classify_anomaly_policy_up) {
  ASSERT_TRUE(classify(false, true, AnomalyPolicy::Up) == ConnectivityState::Up);
  // Only the anomaly row is affected
  ASSERT_TRUE(classify(false, false, AnomalyPolicy::Up) == ConnectivityState::GatewayDown);
  ASSERT_TRUE(classify(true, false, AnomalyPolicy::Up) == ConnectivityState::InternetDown);
}

TEST(parse_anomaly_policy_names) {
  ASSERT_TRUE(netstatus::app::parse_anomaly_policy("gateway_down") == AnomalyPolicy::GatewayDown);
  ASSERT_TRUE(netstatus::app::parse_anomaly_policy("UP") == AnomalyPolicy::Up);
  ASSERT_TRUE(!netstatus::app::parse_anomaly_policy("sideways").has_value());
}

TEST(state_display_names) {
  ASSERT_EQ(std::string(netstatus::model::to_string(ConnectivityState::Up)), "UP");
  ASSERT_EQ(std::string(netstatus::model::to_string(ConnectivityState::GatewayDown)), "GATEWAY_DOWN");
  ASSERT_EQ(std::string(netstatus::model::to_string(ConnectivityState::InternetDown)), "INTERNET_DOWN");
  ASSERT_EQ(std::string(netstatus::model::to_string(ConnectivityState::Unknown)), "UNKNOWN");
}
