#include "probes/Resolver.hpp"
#include <arpa/inet.h>
#include <netdb.h>
#include <cstdio>
#include <cstring>
#include <exception>
#include <thread>

namespace netstatus::probes {

Resolver::Resolver(LookupFn lookup) : lookup_(std::move(lookup)) {}

Resolver::Answer Resolver::parse_literal(const std::string& host) {
  sockaddr_in sa{};
  sa.sin_family = AF_INET;
  if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) == 1) return sa;
  return std::nullopt;
}

Resolver::Answer Resolver::system_lookup(const std::string& host) {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_DGRAM;
  addrinfo* res = nullptr;
  int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
  if (rc != 0 || !res) {
    std::fprintf(stderr, "netstatus: resolver: %s: %s\n", host.c_str(), ::gai_strerror(rc));
    return std::nullopt;
  }
  sockaddr_in sa{};
  std::memcpy(&sa, res->ai_addr, sizeof(sa));
  ::freeaddrinfo(res);
  return sa;
}

Resolver::Answer Resolver::resolve(const std::string& host, std::chrono::steady_clock::time_point deadline) {
  if (auto lit = parse_literal(host)) return lit;

  std::shared_future<Answer> pending;
  {
    std::lock_guard lk(mu_);
    auto it = entries_.find(host);
    if (it != entries_.end()) {
      pending = it->second;
    } else {
      std::promise<Answer> promise;
      pending = promise.get_future().share();
      entries_.emplace(host, pending);
      // getaddrinfo cannot be cancelled, so the lookup runs detached and only
      // touches its own copies plus the shared state of the promise
      std::thread([lookup = lookup_, host, promise = std::move(promise)]() mutable {
        Answer answer;
        try {
          answer = lookup(host);
        } catch (const std::exception& e) {
          std::fprintf(stderr, "netstatus: resolver: %s: %s\n", host.c_str(), e.what());
        }
        promise.set_value(answer);
      }).detach();
    }
  }

  if (pending.wait_until(deadline) != std::future_status::ready) return std::nullopt;
  Answer answer = pending.get();
  if (!answer) forget(host);
  return answer;
}

void Resolver::forget(const std::string& host) {
  std::lock_guard lk(mu_);
  entries_.erase(host);
}

} // namespace netstatus::probes
