#include "app/WebServer.hpp"
#include "app/Stats.hpp"
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>

namespace netstatus::app {

static const char* reason_phrase(int status) {
  switch (status) {
    case 200: return "OK";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
  }
  return "Bad Request";
}

std::string response_headers(const HttpResponse& r) {
  std::string h = "HTTP/1.1 " + std::to_string(r.status) + " " + reason_phrase(r.status) + "\r\n";
  h += "Content-Type: " + r.content_type + "\r\n";
  h += "Cache-Control: no-store\r\n";
  h += "Connection: close\r\n";
  h += "Content-Length: " + std::to_string(r.body.size()) + "\r\n\r\n";
  return h;
}

bool configure_client_socket(int fd) {
  using namespace std::chrono;
  const auto us = duration_cast<microseconds>(kClientIoTimeout).count();
  struct timeval tv{};
  tv.tv_sec = static_cast<time_t>(us / 1000000);
  tv.tv_usec = static_cast<suseconds_t>(us % 1000000);
  bool ok = ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
  ok = ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0 && ok;
  int one = 1;
  // Fails harmlessly on non-TCP sockets
  (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  return ok;
}

HttpResponse route_request(std::string_view request_line, const HistoryStore& history,
                           const WebOptions& opts) {
  // METHOD SP target SP version
  auto sp1 = request_line.find(' ');
  if (sp1 == std::string_view::npos) return {400, "text/plain; charset=utf-8", "400 Bad Request\n"};
  std::string_view method = request_line.substr(0, sp1);
  std::string_view target = request_line.substr(sp1 + 1);
  if (auto sp2 = target.find(' '); sp2 != std::string_view::npos) target = target.substr(0, sp2);
  if (auto q = target.find('?'); q != std::string_view::npos) target = target.substr(0, q);

  if (method != "GET" && method != "HEAD") {
    return {405, "text/plain; charset=utf-8", "405 Method Not Allowed\n"};
  }

  if (target == "/" || target == "/index.html") {
    auto view = build_dashboard(history, opts.recent_rows);
    return {200, "text/html; charset=utf-8", view_to_html(view, opts.page)};
  }
  if (target == "/api/status") {
    auto view = build_dashboard(history, opts.recent_rows);
    return {200, "application/json", view_to_status_json(view)};
  }
  if (target == "/api/series") {
    return {200, "application/json", series_to_json(chart_series(history.snapshot()))};
  }
  if (target == "/metrics") {
    auto view = build_dashboard(history, opts.recent_rows);
    return {200, "text/plain; version=0.0.4; charset=utf-8", view_to_prometheus(view)};
  }
  return {404, "text/plain; charset=utf-8", "404 Not Found\n"};
}

} // namespace netstatus::app
