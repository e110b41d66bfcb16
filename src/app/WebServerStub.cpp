#include "app/WebServer.hpp"
#include <cstdio>

namespace netstatus::app {

WebServer::WebServer(const HistoryStore& history, WebOptions opts)
    : history_(history), opts_(std::move(opts)) {}

WebServer::~WebServer() = default;

void WebServer::start() {
  std::fprintf(stderr, "netstatus: built without io_uring; web dashboard on :%d disabled\n", opts_.port);
}
void WebServer::stop() {}

} // namespace netstatus::app
