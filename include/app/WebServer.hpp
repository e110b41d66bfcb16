#pragma once

#include <chrono>
#include <cstdint>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include "app/HistoryStore.hpp"
#include "app/Render.hpp"

namespace netstatus::app {

struct HttpResponse {
  int status{200};
  std::string content_type{"text/plain; charset=utf-8"};
  std::string body;
};

struct WebOptions {
  uint16_t port{5000};
  size_t recent_rows{50};
  PageInfo page{};
};

// Route one request line ("GET /path HTTP/1.1") against the current history.
// Read-only: takes one snapshot of the history per call.
[[nodiscard]] HttpResponse route_request(std::string_view request_line, const HistoryStore& history,
                                         const WebOptions& opts);

// Status line + headers for a response, Connection: close
[[nodiscard]] std::string response_headers(const HttpResponse& r);

// Clients are served one at a time on the accept thread, so an idle client
// may hold it for at most this long per read or write
inline constexpr std::chrono::milliseconds kClientIoTimeout{1000};

// Send/receive timeouts (kClientIoTimeout) and TCP_NODELAY on an accepted
// socket. False if a timeout could not be set.
bool configure_client_socket(int fd);

class WebServer {
public:
  WebServer(const HistoryStore& history, WebOptions opts);
  ~WebServer();
  WebServer(const WebServer&) = delete;
  WebServer& operator=(const WebServer&) = delete;

  void start();
  void stop();

private:
  void run(std::stop_token st);
  void handle_client(int client_fd);

  const HistoryStore& history_;
  WebOptions opts_;
  int listen_fd_{-1};
  int stop_eventfd_{-1};
  std::jthread thread_;
};

} // namespace netstatus::app
