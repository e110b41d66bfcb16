#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include <sys/socket.h>
#include <netinet/in.h>
#include "probes/IProber.hpp"
#include "probes/Resolver.hpp"

namespace netstatus::probes {

// ICMP echo over an unprivileged datagram socket (net.ipv4.ping_group_range),
// or a raw socket when running with CAP_NET_RAW. IPv4 only. Name lookup and
// the wait for the reply share one deadline of `timeout`.
class IcmpProber : public IProber {
public:
  explicit IcmpProber(std::chrono::milliseconds timeout);

  bool init() override;  // false if neither socket kind can be opened
  model::ProbeResult probe(const std::string& host) override;
  const char* name() const override { return raw_ ? "ICMP (raw)" : "ICMP (datagram)"; }

  // Checksum over an ICMP header + payload (RFC 1071)
  [[nodiscard]] static uint16_t checksum(const void* data, size_t len);

private:
  [[nodiscard]] int open_socket() const;
  [[nodiscard]] model::ProbeResult await_reply(int fd, const sockaddr_in& dst, uint16_t seq,
                                               std::chrono::steady_clock::time_point start,
                                               std::chrono::steady_clock::time_point deadline) const;

  std::chrono::milliseconds timeout_;
  bool raw_{false};
  uint16_t ident_{0};
  std::atomic<uint16_t> next_seq_{1};
  Resolver resolver_;
};

} // namespace netstatus::probes
