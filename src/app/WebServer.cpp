#ifdef NETSTATUS_HAVE_URING

#include "app/WebServer.hpp"
#include <liburing.h>
#include <sys/socket.h>
#include <sys/eventfd.h>
#include <sys/uio.h>
#include <netinet/in.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace netstatus::app {

// Tags for distinguishing CQE sources
enum class UringTag : uint64_t { ListenPoll = 1, StopPoll = 2 };

WebServer::WebServer(const HistoryStore& history, WebOptions opts)
    : history_(history), opts_(std::move(opts)) {}

WebServer::~WebServer() { stop(); }

void WebServer::start() {
  if (thread_.joinable()) return;
  // Created here so stop() can always signal it, even before run() gets going
  stop_eventfd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (stop_eventfd_ < 0) {
    std::fprintf(stderr, "netstatus: web server: eventfd() failed: %s\n", std::strerror(errno));
    return;
  }
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void WebServer::stop() {
  if (stop_eventfd_ >= 0) {
    uint64_t val = 1;
    if (::write(stop_eventfd_, &val, sizeof(val)) < 0) {
      std::fprintf(stderr, "netstatus: web server: stop signal failed: %s\n", std::strerror(errno));
    }
  }
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
  if (stop_eventfd_ >= 0) { ::close(stop_eventfd_); stop_eventfd_ = -1; }
}

void WebServer::run(std::stop_token st) {
  listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (listen_fd_ < 0) {
    std::fprintf(stderr, "netstatus: web server: socket() failed: %s\n", std::strerror(errno));
    return;
  }

  int optval = 1;
  (void)::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

  struct sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(opts_.port);
  addr.sin_addr.s_addr = INADDR_ANY;

  if (::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::fprintf(stderr, "netstatus: web server: bind(:%d) failed: %s\n", opts_.port, std::strerror(errno));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return;
  }

  if (::listen(listen_fd_, 16) < 0) {
    std::fprintf(stderr, "netstatus: web server: listen() failed: %s\n", std::strerror(errno));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return;
  }

  struct io_uring ring{};
  if (int rc = io_uring_queue_init(16, &ring, 0); rc < 0) {
    std::fprintf(stderr, "netstatus: web server: io_uring_queue_init() failed: %s\n", std::strerror(-rc));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return;
  }

  auto submit_poll = [&](int fd, UringTag tag) {
    struct io_uring_sqe* sqe = io_uring_get_sqe(&ring);
    io_uring_prep_poll_add(sqe, fd, POLLIN);
    io_uring_sqe_set_data64(sqe, static_cast<uint64_t>(tag));
  };

  submit_poll(listen_fd_, UringTag::ListenPoll);
  submit_poll(stop_eventfd_, UringTag::StopPoll);
  io_uring_submit(&ring);

  std::fprintf(stderr, "netstatus: web dashboard listening on :%d\n", opts_.port);

  while (!st.stop_requested()) {
    struct io_uring_cqe* cqe = nullptr;
    int ret = io_uring_wait_cqe(&ring, &cqe);
    if (ret < 0) {
      if (ret == -EINTR) continue;
      std::fprintf(stderr, "netstatus: web server: io_uring_wait_cqe() failed: %s\n", std::strerror(-ret));
      break;
    }

    auto tag = static_cast<UringTag>(io_uring_cqe_get_data64(cqe));
    int res = cqe->res;
    io_uring_cqe_seen(&ring, cqe);

    if (tag == UringTag::StopPoll || st.stop_requested()) {
      break;
    }

    if (tag == UringTag::ListenPoll && res >= 0) {
      int client_fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
      if (client_fd >= 0) {
        handle_client(client_fd);
        ::close(client_fd);
      }
      submit_poll(listen_fd_, UringTag::ListenPoll);
      io_uring_submit(&ring);
    }
  }

  io_uring_queue_exit(&ring);
  if (listen_fd_ >= 0) { ::close(listen_fd_); listen_fd_ = -1; }
}

void WebServer::handle_client(int fd) {
  if (!configure_client_socket(fd)) {
    std::fprintf(stderr, "netstatus: web server: client socket timeouts: %s\n", std::strerror(errno));
    return;
  }

  char reqbuf[4096];
  ssize_t nr = ::recv(fd, reqbuf, sizeof(reqbuf) - 1, 0);
  if (nr <= 0) return;
  reqbuf[nr] = '\0';

  std::string_view req(reqbuf, static_cast<size_t>(nr));
  auto line_end = req.find('\r');
  if (line_end == std::string_view::npos) line_end = req.find('\n');
  std::string_view request_line = req.substr(0, line_end);

  HttpResponse resp = route_request(request_line, history_, opts_);
  std::string headers = response_headers(resp);
  const bool head_only = request_line.starts_with("HEAD ");

  // Scatter-gather: headers + body, no concatenation
  struct iovec iov[2] = {
    {.iov_base = headers.data(), .iov_len = headers.size()},
    {.iov_base = resp.body.data(), .iov_len = head_only ? 0 : resp.body.size()}
  };
  struct msghdr msg{};
  msg.msg_iov = iov;
  msg.msg_iovlen = 2;
  if (::sendmsg(fd, &msg, MSG_NOSIGNAL) < 0) {
    std::fprintf(stderr, "netstatus: web server: sendmsg failed: %s\n", std::strerror(errno));
  }
}

} // namespace netstatus::app

#endif // NETSTATUS_HAVE_URING
