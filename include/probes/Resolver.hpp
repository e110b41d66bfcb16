#pragma once
#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <netinet/in.h>

namespace netstatus::probes {

// IPv4 lookups bounded by the caller's deadline. Address literals never touch
// the resolver. Names are looked up on a helper thread; a lookup still running
// at the deadline keeps going in the background and its answer is cached for
// the next probe. Failed lookups are not cached.
class Resolver {
public:
  using Answer = std::optional<sockaddr_in>;
  // Must be self-contained: it may outlive the Resolver on a detached thread.
  using LookupFn = std::function<Answer(const std::string&)>;

  explicit Resolver(LookupFn lookup = system_lookup);

  [[nodiscard]] Answer resolve(const std::string& host, std::chrono::steady_clock::time_point deadline);

  // Drop the cached answer so the next resolve() asks again
  void forget(const std::string& host);

  [[nodiscard]] static Answer parse_literal(const std::string& host);
  // Blocking getaddrinfo (AF_INET)
  [[nodiscard]] static Answer system_lookup(const std::string& host);

private:
  LookupFn lookup_;
  std::mutex mu_;
  std::unordered_map<std::string, std::shared_future<Answer>> entries_;
};

} // namespace netstatus::probes
