#include "minitest.hpp"
#include "app/Alerts.hpp"
#include "app/SmtpNotifier.hpp"
#include <chrono>
#include <string>

using netstatus::model::ConnectivityState;
using netstatus::model::StateChange;

static netstatus::app::AlertEngine engine() {
  return netstatus::app::AlertEngine({"192.168.0.1", "8.8.8.8"});
}

static StateChange change(ConnectivityState from, ConnectivityState to) {
  return {from, to, netstatus::model::Clock::time_point{} + std::chrono::seconds(1700000000)};
}

static bool contains(const std::string& s, const char* needle) { return s.find(needle) != std::string::npos; }

TEST(alert_gateway_down) {
  auto a = engine().evaluate(change(ConnectivityState::Up, ConnectivityState::GatewayDown));
  ASSERT_TRUE(a.has_value());
  ASSERT_EQ(a->severity, "crit");
  ASSERT_TRUE(contains(a->message, "ALERT: Router/Gateway (192.168.0.1) is DOWN."));
  ASSERT_EQ(a->message.front(), '[');
}

TEST(alert_internet_down) {
  auto a = engine().evaluate(change(ConnectivityState::Up, ConnectivityState::InternetDown));
  ASSERT_TRUE(a.has_value());
  ASSERT_EQ(a->severity, "crit");
  ASSERT_TRUE(contains(a->message, "ALERT: Internet is DOWN (router OK, but cannot reach 8.8.8.8)."));
}

TEST(alert_restored) {
  for (auto from : {ConnectivityState::GatewayDown, ConnectivityState::InternetDown}) {
    auto a = engine().evaluate(change(from, ConnectivityState::Up));
    ASSERT_TRUE(a.has_value());
    ASSERT_EQ(a->severity, "info");
    ASSERT_TRUE(contains(a->message, "INFO: Connectivity RESTORED (state: UP)."));
  }
}

TEST(alert_none_for_startup_up) {
  ASSERT_TRUE(!engine().evaluate(change(ConnectivityState::Unknown, ConnectivityState::Up)).has_value());
}

TEST(alert_startup_into_outage) {
  auto a = engine().evaluate(change(ConnectivityState::Unknown, ConnectivityState::InternetDown));
  ASSERT_TRUE(a.has_value());
  ASSERT_EQ(a->severity, "crit");
}

TEST(alert_none_without_change) {
  for (auto s : {ConnectivityState::Up, ConnectivityState::GatewayDown, ConnectivityState::InternetDown}) {
    ASSERT_TRUE(!engine().evaluate(change(s, s)).has_value());
  }
}

TEST(alert_gateway_to_internet_down) {
  auto a = engine().evaluate(change(ConnectivityState::GatewayDown, ConnectivityState::InternetDown));
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(contains(a->message, "Internet is DOWN"));
}

TEST(smtp_message_layout) {
  netstatus::app::SmtpSettings s;
  s.to = "ops@example.com";
  auto ts = netstatus::model::Clock::time_point{} + std::chrono::seconds(1700000000);
  auto m = netstatus::app::SmtpNotifier::build_message(s, "ALERT: Router/Gateway (10.0.0.1) is DOWN.", ts);
  ASSERT_EQ(m.rfind("Date: ", 0), 0u);
  ASSERT_TRUE(contains(m, "GMT\r\n") || contains(m, "+0000\r\n"));
  ASSERT_TRUE(contains(m, "\r\nFrom: network-monitor@example.com\r\n"));
  ASSERT_TRUE(contains(m, "\r\nTo: ops@example.com\r\n"));
  ASSERT_TRUE(contains(m, "\r\nSubject: Network Monitor Alert\r\n"));
  ASSERT_TRUE(contains(m, "\r\n\r\nALERT: Router/Gateway (10.0.0.1) is DOWN.\r\n"));
}
