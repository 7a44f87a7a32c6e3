#include "taskd/server.hpp"

#include <cerrno>
#include <cstring>

#include <stdexcept>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include "taskd/log.hpp"

namespace taskd {

namespace {

bool set_non_blocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

}  // namespace

Server::Server(uint16_t port, const std::string& bind_addr) : port_(port), bind_addr_(bind_addr) {
  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_);
  if (bind_addr_.empty()) {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (bind_addr_ == "localhost") {
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  } else if (::inet_pton(AF_INET, bind_addr_.c_str(), &addr.sin_addr) != 1) {
    TASKD_THROW(std::runtime_error("Invalid bind address: " + bind_addr_));
  }

  server_sock_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (server_sock_ < 0) {
    TASKD_THROW(std::runtime_error("Failed to create socket"));
  }

  int reuse = 1;
  if (::setsockopt(server_sock_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    TASKD_LOG_WARN(std::string("SO_REUSEADDR failed: ") + std::strerror(errno));
  }

  if (::bind(server_sock_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    ::close(server_sock_);
    TASKD_THROW(std::runtime_error("Failed to bind " + bind_addr_ + ":" + std::to_string(port_) + ": " +
                                   std::strerror(err)));
  }

  if (::listen(server_sock_, 128) < 0 || !set_non_blocking(server_sock_)) {
    int err = errno;
    ::close(server_sock_);
    TASKD_THROW(std::runtime_error(std::string("Failed to listen: ") + std::strerror(err)));
  }

  if (port_ == 0) {
    socklen_t len = sizeof(addr);
    if (::getsockname(server_sock_, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
      port_ = ntohs(addr.sin_port);
    }
  }

  wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wake_fd_ < 0) {
    int err = errno;
    ::close(server_sock_);
    TASKD_THROW(std::runtime_error(std::string("Failed to create eventfd: ") + std::strerror(err)));
  }

  TASKD_LOG_INFO("Server listening on " + (bind_addr_.empty() ? std::string("0.0.0.0") : bind_addr_) + ":" +
                 std::to_string(port_));
}

Server::~Server() {
  if (server_sock_ >= 0) ::close(server_sock_);
  if (wake_fd_ >= 0) ::close(wake_fd_);
}

void Server::stop() {
  stop_requested_.store(true, std::memory_order_release);
  // Async-signal-safe path: no logging. EAGAIN means the counter is already
  // nonzero, so poll() wakes either way.
  uint64_t one = 1;
  ssize_t n = ::write(wake_fd_, &one, sizeof(one));
  static_cast<void>(n);
}

void Server::wake() {
  uint64_t one = 1;
  if (::write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
    TASKD_LOG_ERROR(std::string("eventfd write failed: ") + std::strerror(errno));
  }
}

void Server::drain_wakeups() {
  uint64_t count = 0;
  while (::read(wake_fd_, &count, sizeof(count)) > 0) {
  }
}

expected<void, ErrorCode> Server::run() {
  drain_wakeups();
  WorkQueue queue(queue_capacity_);
  queue.set_on_pop([this] { wake(); });
  WorkerPool pool(queue, num_workers_, metrics_, digest_fn_);

  is_running_.store(true, std::memory_order_release);
  TASKD_LOG_INFO("Server running: workers=" + std::to_string(pool.size()) +
                 " queue_capacity=" + std::to_string(queue.capacity()) +
                 " max_connections=" + std::to_string(max_connections_));

  auto result = expected<void, ErrorCode>::success();

  while (!stop_requested_.load(std::memory_order_acquire)) {
    size_t nfds = 0;
    poll_fds_[nfds++] = {server_sock_, POLLIN, 0};
    poll_fds_[nfds++] = {wake_fd_, POLLIN, 0};

    for (uint32_t i = 0; i < connections_.size(); ++i) {
      short events = 0;
      if (connections_[i]->wants_read()) events |= POLLIN;
      if (connections_[i]->wants_write()) events |= POLLOUT;
      poll_fds_[nfds++] = {connections_[i]->get_fd(), events, 0};
    }

    int ret = ::poll(poll_fds_.data(), static_cast<nfds_t>(nfds), poll_timeout_ms_);
    if (ret < 0) {
      if (errno == EINTR) continue;
      TASKD_LOG_ERROR(std::string("poll failed: ") + std::strerror(errno));
      result = expected<void, ErrorCode>::error(ErrorCode::kSocketError);
      break;
    }

    if (ret > 0) {
      // Workers freed queue space or resolved replies
      if (poll_fds_[1].revents & POLLIN) {
        drain_wakeups();
        for (uint32_t i = 0; i < connections_.size(); ++i) {
          auto& conn = connections_[i];
          if (conn->is_closed()) continue;
          auto r = conn->handle_wakeup();
          if (!r) close_connection(conn, r.get_error());
        }
      }

      for (size_t i = 2; i < nfds; ++i) {
        if (i - 2 >= connections_.size()) break;
        handle_connection_io(connections_[static_cast<uint32_t>(i - 2)], poll_fds_[i]);
      }

      if (poll_fds_[0].revents & POLLIN) {
        auto accepted = accept_connection(queue);
        if (!accepted && accepted.get_error() == ErrorCode::kSocketError) {
          TASKD_LOG_WARN(std::string("accept failed: ") + std::strerror(errno));
        }
      }
    }

    enforce_read_timeouts();
    remove_closed_connections();
  }

  for (uint32_t i = 0; i < connections_.size(); ++i) {
    connections_[i]->close();
  }
  remove_closed_connections();

  queue.close();
  pool.join();
  queue.set_on_pop(nullptr);
  drain_wakeups();
  stop_requested_.store(false, std::memory_order_release);
  is_running_.store(false, std::memory_order_release);
  TASKD_LOG_INFO("Server stopped");
  return result;
}

expected<void, ErrorCode> Server::accept_connection(WorkQueue& queue) {
  struct sockaddr_in client_addr;
  socklen_t client_addr_len = sizeof(client_addr);
  int client_sock = ::accept4(server_sock_, reinterpret_cast<struct sockaddr*>(&client_addr), &client_addr_len,
                              SOCK_NONBLOCK | SOCK_CLOEXEC);
  if (client_sock < 0) {
    int err = errno;
    if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR || err == ECONNABORTED) {
      return expected<void, ErrorCode>::success();
    }
    metric_inc(metrics_.socket_errors);
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }

  if (connections_.size() >= max_connections_ || connections_.full()) {
    ::close(client_sock);
    metric_inc(metrics_.rejected_connections);
    TASKD_LOG_WARN("Connection limit reached (" + std::to_string(max_connections_) + "), rejecting");
    return expected<void, ErrorCode>::error(ErrorCode::kMaxConnectionsExceeded);
  }

  apply_tcp_tuning(client_sock);

  uint64_t id = next_conn_id_++;
  auto conn = std::make_shared<Connection>(id, client_sock, queue, metrics_, [this] { wake(); }, read_timeout_ms_);
  connections_.push_back(std::move(conn));
  metric_inc(metrics_.total_connections);
  metric_inc(metrics_.active_connections);

  char ip[INET_ADDRSTRLEN] = {0};
  ::inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
  TASKD_LOG_DEBUG("Connection " + std::to_string(id) + " accepted from " + ip + ":" +
                  std::to_string(ntohs(client_addr.sin_port)));
  return expected<void, ErrorCode>::success();
}

void Server::handle_connection_io(ConnPtr& conn, const pollfd& pfd) {
  if (conn->is_closed()) return;

  if (pfd.revents & POLLIN) {
    auto r = conn->handle_read();
    if (!r) {
      close_connection(conn, r.get_error());
      return;
    }
  }
  if (pfd.revents & POLLOUT) {
    auto r = conn->handle_write();
    if (!r) {
      close_connection(conn, r.get_error());
      return;
    }
  }
  if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
    close_connection(conn, ErrorCode::kConnectionClosed);
  }
}

void Server::close_connection(ConnPtr& conn, ErrorCode reason) {
  if (reason == ErrorCode::kConnectionClosed) {
    TASKD_LOG_DEBUG("Connection " + std::to_string(conn->get_id()) + " closed by peer");
  } else {
    TASKD_LOG_INFO("Closing connection " + std::to_string(conn->get_id()) + ": " + error_code_name(reason));
  }
  conn->close();
}

void Server::enforce_read_timeouts() {
  for (uint32_t i = 0; i < connections_.size(); ++i) {
    auto& conn = connections_[i];
    if (!conn->is_closed() && conn->is_read_timed_out()) {
      metric_inc(metrics_.read_timeouts);
      close_connection(conn, ErrorCode::kTimeout);
    }
  }
}

void Server::remove_closed_connections() {
  uint32_t i = 0;
  while (i < connections_.size()) {
    if (connections_[i]->is_closed()) {
      connections_.erase_unordered(i);
      metric_dec(metrics_.active_connections);
    } else {
      ++i;
    }
  }
}

void Server::apply_tcp_tuning(int fd) {
  int opt = 1;
  if (tcp_tuning_.tcp_nodelay && ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0) {
    TASKD_LOG_DEBUG(std::string("TCP_NODELAY failed: ") + std::strerror(errno));
  }
#ifdef TCP_QUICKACK
  if (tcp_tuning_.tcp_quickack && ::setsockopt(fd, IPPROTO_TCP, TCP_QUICKACK, &opt, sizeof(opt)) < 0) {
    TASKD_LOG_DEBUG(std::string("TCP_QUICKACK failed: ") + std::strerror(errno));
  }
#endif
  if (tcp_tuning_.so_keepalive) {
    if (::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt)) < 0) {
      TASKD_LOG_DEBUG(std::string("SO_KEEPALIVE failed: ") + std::strerror(errno));
      return;
    }
#ifdef TCP_KEEPIDLE
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &tcp_tuning_.keepalive_idle_s, sizeof(tcp_tuning_.keepalive_idle_s));
#endif
#ifdef TCP_KEEPINTVL
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &tcp_tuning_.keepalive_interval_s,
                 sizeof(tcp_tuning_.keepalive_interval_s));
#endif
#ifdef TCP_KEEPCNT
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &tcp_tuning_.keepalive_count, sizeof(tcp_tuning_.keepalive_count));
#endif
  }
}

// ============================================================================
// Entry point
// ============================================================================

expected<void, ErrorCode> parse_listen_address(std::string_view address, std::string* host, uint16_t* port) {
  auto invalid = expected<void, ErrorCode>::error(ErrorCode::kInvalidAddress);

  size_t colon = address.rfind(':');
  if (colon == std::string_view::npos) return invalid;

  std::string_view port_text = address.substr(colon + 1);
  if (port_text.empty() || port_text.size() > 5) return invalid;

  uint32_t value = 0;
  for (char c : port_text) {
    if (c < '0' || c > '9') return invalid;
    value = value * 10 + static_cast<uint32_t>(c - '0');
  }
  if (value == 0 || value > 65535) return invalid;

  host->assign(address.substr(0, colon));
  *port = static_cast<uint16_t>(value);
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> run(const std::string& listen_address, size_t num_workers) {
  std::string host;
  uint16_t port = 0;
  auto parsed = parse_listen_address(listen_address, &host, &port);
  if (!parsed) {
    TASKD_LOG_ERROR("Invalid listen address: " + listen_address);
    return parsed;
  }

  try {
    Server server(port, host);
    server.set_num_workers(num_workers);
    return server.run();
  } catch (const std::runtime_error& e) {
    TASKD_LOG_ERROR(e.what());
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }
}

}  // namespace taskd
