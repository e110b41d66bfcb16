#include "probes/IProber.hpp"
#include "probes/CommandProber.hpp"
#include "probes/IcmpProber.hpp"
#include "util/AsciiLower.hpp"
#include <cstdio>

namespace netstatus::probes {

ProbeMethod parse_probe_method(const std::string& s) {
  std::string v = s;
  for (auto& c : v) c = netstatus::util::ascii_lower(static_cast<unsigned char>(c));
  if (v == "icmp") return ProbeMethod::Icmp;
  if (v == "command" || v == "ping") return ProbeMethod::Command;
  return ProbeMethod::Auto;
}

std::unique_ptr<IProber> make_prober(ProbeMethod method, std::chrono::milliseconds timeout) {
  auto make_command = [&]{
    if (CommandProber::wait_seconds(timeout) > timeout) {
      std::fprintf(stderr, "netstatus: ping command waits whole seconds; probe timeout %lldms rounds up to %llds\n",
                   static_cast<long long>(timeout.count()),
                   static_cast<long long>(CommandProber::wait_seconds(timeout).count()));
    }
    return std::unique_ptr<IProber>(new CommandProber(timeout));
  };

  if (method == ProbeMethod::Command) {
    auto cmd = make_command();
    if (!cmd->init()) {
      std::fprintf(stderr, "netstatus: ping command unavailable; every probe will report unreachable\n");
    }
    return cmd;
  }

  auto icmp = std::unique_ptr<IProber>(new IcmpProber(timeout));
  if (icmp->init()) return icmp;

  if (method == ProbeMethod::Icmp) {
    std::fprintf(stderr, "netstatus: ICMP sockets unavailable (need CAP_NET_RAW or ping_group_range?)\n");
    return icmp;
  }
  std::fprintf(stderr, "netstatus: ICMP sockets unavailable. Falling back to ping command.\n");
  auto cmd = make_command();
  if (!cmd->init()) {
    std::fprintf(stderr, "netstatus: no probing mechanism available; every probe will report unreachable\n");
  }
  return cmd;
}

} // namespace netstatus::probes
