#pragma once
#include <optional>
#include <string>
#include <string_view>
#include "probes/IProber.hpp"
#include "probes/Resolver.hpp"

namespace netstatus::probes {

// Shells out to `ping -c 1 -W <secs> <address>`; exit status 0 means reachable.
// ping only waits in whole seconds, so timeouts round up to the next second.
// Names are resolved here under the same deadline and ping gets the address.
class CommandProber : public IProber {
public:
  explicit CommandProber(std::chrono::milliseconds timeout);

  bool init() override;  // false if no ping binary is on PATH
  model::ProbeResult probe(const std::string& host) override;
  const char* name() const override { return "ping command"; }

  // Extract the round trip from a line like "64 bytes from ...: icmp_seq=1 ttl=57 time=12.3 ms"
  [[nodiscard]] static std::optional<double> parse_rtt_ms(std::string_view output);
  // Only hostnames and IP literals are passed to the shell
  [[nodiscard]] static bool is_safe_host(std::string_view host);
  // The -W/-w value used for a timeout (at least one second)
  [[nodiscard]] static std::chrono::seconds wait_seconds(std::chrono::milliseconds timeout);

private:
  std::chrono::milliseconds timeout_;
  Resolver resolver_;
};

} // namespace netstatus::probes
