#pragma once
#include <chrono>
#include <string>
#include "app/Alerts.hpp"

namespace netstatus::app {

struct SmtpSettings {
  std::string server{"smtp.example.com"};
  int port{587};
  std::string username;
  std::string password;
  std::string from{"network-monitor@example.com"};
  std::string to;
  std::string subject{"Network Monitor Alert"};
  std::chrono::seconds timeout{30};
};

// Plain-text e-mail over SMTP with STARTTLS (libcurl). Throws
// std::runtime_error when delivery fails.
class SmtpNotifier : public INotifier {
public:
  SmtpNotifier(SmtpSettings settings, AlertEngine engine);

  void notify(const model::StateChange& change) override;

  // Full RFC 5322 message (headers, blank line, body) with CRLF line endings
  [[nodiscard]] static std::string build_message(const SmtpSettings& s, const std::string& body,
                                                 model::Clock::time_point ts);

private:
  void send(const std::string& payload);

  SmtpSettings settings_;
  AlertEngine engine_;
};

} // namespace netstatus::app
