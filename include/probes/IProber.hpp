#pragma once
#include <chrono>
#include <memory>
#include <string>
#include "model/CheckRecord.hpp"

namespace netstatus::probes {

// One reachability check against one host. Implementations never throw:
// timeouts and network errors come back as reachable=false.
class IProber {
public:
  virtual ~IProber() = default;

  // Return false if the probing mechanism is unavailable (permissions, missing binary).
  [[nodiscard]] virtual bool init() { return true; }

  [[nodiscard]] virtual model::ProbeResult probe(const std::string& host) = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

enum class ProbeMethod { Auto, Icmp, Command };

// "auto" | "icmp" | "command"; unknown strings map to Auto
[[nodiscard]] ProbeMethod parse_probe_method(const std::string& s);

// Auto tries ICMP sockets first and falls back to the system ping command.
[[nodiscard]] std::unique_ptr<IProber> make_prober(ProbeMethod method, std::chrono::milliseconds timeout);

} // namespace netstatus::probes
