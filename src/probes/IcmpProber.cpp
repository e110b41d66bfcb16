#include "probes/IcmpProber.hpp"
#include <netinet/ip_icmp.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>

using namespace std::chrono;

namespace netstatus::probes {

namespace {

// Closes the probe socket on every return path
struct FdCloser {
  int fd;
  ~FdCloser() { if (fd >= 0) ::close(fd); }
};

constexpr size_t kPayloadLen = 32;

struct EchoPacket {
  icmphdr hdr;
  unsigned char payload[kPayloadLen];
};

} // namespace

IcmpProber::IcmpProber(milliseconds timeout) : timeout_(timeout) {}

bool IcmpProber::init() {
  ident_ = static_cast<uint16_t>(::getpid() & 0xFFFF);
  raw_ = false;
  int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_ICMP);
  if (fd < 0) {
    raw_ = true;
    fd = ::socket(AF_INET, SOCK_RAW | SOCK_CLOEXEC, IPPROTO_ICMP);
  }
  if (fd < 0) {
    std::fprintf(stderr, "netstatus: icmp prober: no ICMP socket available: %s\n", std::strerror(errno));
    return false;
  }
  ::close(fd);
  return true;
}

int IcmpProber::open_socket() const {
  return ::socket(AF_INET, (raw_ ? SOCK_RAW : SOCK_DGRAM) | SOCK_CLOEXEC, IPPROTO_ICMP);
}

uint16_t IcmpProber::checksum(const void* data, size_t len) {
  const auto* p = static_cast<const unsigned char*>(data);
  uint32_t sum = 0;
  for (; len > 1; len -= 2, p += 2) sum += static_cast<uint32_t>((p[0] << 8) | p[1]);
  if (len == 1) sum += static_cast<uint32_t>(p[0] << 8);
  while (sum >> 16) sum = (sum & 0xFFFF) + (sum >> 16);
  return htons(static_cast<uint16_t>(~sum & 0xFFFF));
}

model::ProbeResult IcmpProber::probe(const std::string& host) {
  const auto deadline = steady_clock::now() + timeout_;
  auto dst = resolver_.resolve(host, deadline);
  if (!dst) return {};
  FdCloser sock{open_socket()};
  if (sock.fd < 0) return {};

  const uint16_t seq = next_seq_.fetch_add(1, std::memory_order_relaxed);
  EchoPacket pkt{};
  pkt.hdr.type = ICMP_ECHO;
  pkt.hdr.code = 0;
  pkt.hdr.un.echo.id = htons(ident_);
  pkt.hdr.un.echo.sequence = htons(seq);
  std::memcpy(pkt.payload, "netstatus-echo", 14);
  pkt.hdr.checksum = checksum(&pkt, sizeof(pkt));

  const auto start = steady_clock::now();
  if (::sendto(sock.fd, &pkt, sizeof(pkt), 0, reinterpret_cast<const sockaddr*>(&*dst), sizeof(*dst)) < 0) {
    resolver_.forget(host);
    return {};
  }

  auto result = await_reply(sock.fd, *dst, seq, start, deadline);
  // The address may have moved; look the name up again next time
  if (!result.reachable) resolver_.forget(host);
  return result;
}

model::ProbeResult IcmpProber::await_reply(int fd, const sockaddr_in& dst, uint16_t seq,
                                           steady_clock::time_point start,
                                           steady_clock::time_point deadline) const {
  unsigned char buf[1500];
  for (;;) {
    auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
    if (remaining.count() <= 0) return {};
    struct pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
    int rv = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (rv == 0) return {};
    if (rv < 0) {
      if (errno == EINTR) continue;
      return {};
    }
    sockaddr_in from{};
    socklen_t fromlen = sizeof(from);
    ssize_t n = ::recvfrom(fd, buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&from), &fromlen);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      return {};
    }
    const unsigned char* p = buf;
    size_t len = static_cast<size_t>(n);
    // Raw sockets deliver the IP header too
    if (raw_) {
      if (len < 20) continue;
      size_t ihl = static_cast<size_t>(buf[0] & 0x0F) * 4;
      if (len < ihl) continue;
      p += ihl; len -= ihl;
    }
    if (len < sizeof(icmphdr)) continue;
    icmphdr reply{};
    std::memcpy(&reply, p, sizeof(reply));
    if (reply.type != ICMP_ECHOREPLY) continue;
    if (from.sin_addr.s_addr != dst.sin_addr.s_addr) continue;
    if (ntohs(reply.un.echo.sequence) != seq) continue;
    // Datagram sockets have the id rewritten by the kernel
    if (raw_ && ntohs(reply.un.echo.id) != ident_) continue;
    double rtt = duration<double, std::milli>(steady_clock::now() - start).count();
    return {true, rtt};
  }
}

} // namespace netstatus::probes
