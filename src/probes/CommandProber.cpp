#include "probes/CommandProber.hpp"
#include <arpa/inet.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

using namespace std::chrono;

namespace netstatus::probes {

CommandProber::CommandProber(milliseconds timeout) : timeout_(timeout) {}

seconds CommandProber::wait_seconds(milliseconds timeout) {
  auto secs = duration_cast<seconds>(timeout + milliseconds(999));
  return secs < seconds(1) ? seconds(1) : secs;
}

bool CommandProber::init() {
  const char* path = std::getenv("PATH");
  std::string dirs = (path && *path) ? path : "/usr/bin:/bin";
  size_t pos = 0;
  while (pos <= dirs.size()) {
    size_t end = dirs.find(':', pos);
    if (end == std::string::npos) end = dirs.size();
    std::string candidate = dirs.substr(pos, end - pos) + "/ping";
    if (::access(candidate.c_str(), X_OK) == 0) return true;
    pos = end + 1;
  }
  std::fprintf(stderr, "netstatus: command prober: ping not found on PATH\n");
  return false;
}

bool CommandProber::is_safe_host(std::string_view host) {
  if (host.empty() || host.size() > 253 || host.front() == '-') return false;
  for (char c : host) {
    auto uc = static_cast<unsigned char>(c);
    if (!(std::isalnum(uc) || c == '.' || c == '-' || c == ':')) return false;
  }
  return true;
}

std::optional<double> CommandProber::parse_rtt_ms(std::string_view output) {
  auto pos = output.find("time=");
  size_t skip = 5;
  if (pos == std::string_view::npos) { pos = output.find("time<"); }
  if (pos == std::string_view::npos) return std::nullopt;
  auto rest = output.substr(pos + skip);
  size_t n = 0;
  while (n < rest.size() && (std::isdigit(static_cast<unsigned char>(rest[n])) || rest[n] == '.')) ++n;
  if (n == 0) return std::nullopt;
  try { return std::stod(std::string(rest.substr(0, n))); } catch (const std::exception&) { return std::nullopt; }
}

model::ProbeResult CommandProber::probe(const std::string& host) {
  if (!is_safe_host(host)) return {};
  const long secs = static_cast<long>(wait_seconds(timeout_).count());

  // IPv6 literals go to ping untouched; everything else becomes a dotted quad
  std::string target = host;
  in6_addr v6{};
  if (::inet_pton(AF_INET6, host.c_str(), &v6) != 1) {
    auto addr = resolver_.resolve(host, steady_clock::now() + timeout_);
    if (!addr) return {};
    char buf[INET_ADDRSTRLEN];
    if (!::inet_ntop(AF_INET, &addr->sin_addr, buf, sizeof(buf))) return {};
    target = buf;
  }

  std::string cmd = "ping -n -c 1 -W " + std::to_string(secs) + " -w " + std::to_string(secs) +
                    " " + target + " 2>/dev/null";
  FILE* fp = ::popen(cmd.c_str(), "r");
  if (!fp) return {};
  std::string out;
  char line[256];
  while (std::fgets(line, sizeof(line), fp)) out += line;
  int status = ::pclose(fp);
  if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    resolver_.forget(host);
    return {};
  }
  return {true, parse_rtt_ms(out)};
}

} // namespace netstatus::probes
