/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */


#ifndef TASKD_SERVER_HPP_
#define TASKD_SERVER_HPP_

#include "connection.hpp"
#include "digest.hpp"
#include "dispatch_queue.hpp"
#include "metrics.hpp"
#include "vocabulary.hpp"
#include "worker_pool.hpp"

#include <cstdint>

#include <array>
#include <atomic>
#include <memory>
#include <string>
#include <string_view>

#include <poll.h>

namespace taskd {

// ============================================================================
// TCP Tuning Configuration
// ============================================================================

struct TcpTuning {
  bool tcp_nodelay = true;      // Responses are small; do not wait on Nagle
  bool tcp_quickack = false;    // Reduce ACK delay (Linux-specific)
  bool so_keepalive = false;    // Enable TCP keepalive

  // Keepalive parameters (Linux-specific, effective when so_keepalive=true)
  int keepalive_idle_s = 60;
  int keepalive_interval_s = 10;
  int keepalive_count = 5;
};

// ============================================================================
// Server (poll() reactor + worker pool)
// ============================================================================

class Server {
 public:
  using ConnPtr = std::shared_ptr<Connection>;

  // Binds and listens immediately; throws std::runtime_error on failure.
  // Port 0 picks an ephemeral port (see port()).
  explicit Server(uint16_t port, const std::string& bind_addr = "");
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Start the worker pool and serve until stop(). Blocking.
  // Returns error(kSocketError) only if poll() itself fails. May be called
  // again after it returns; connections and workers do not carry over.
  expected<void, ErrorCode> run();

  // Safe to call from any thread and from a signal handler.
  void stop();

  // Configuration (before run())
  Server& set_num_workers(size_t n) {
    num_workers_ = n;
    return *this;
  }

  Server& set_queue_capacity(size_t n) {
    queue_capacity_ = n;
    return *this;
  }

  Server& set_max_connections(size_t max) {
    max_connections_ = max < kMaxConnections ? max : kMaxConnections;
    return *this;
  }

  Server& set_poll_timeout_ms(int timeout) {
    poll_timeout_ms_ = timeout;
    return *this;
  }

  Server& set_read_timeout_ms(int timeout) {
    read_timeout_ms_ = timeout;
    return *this;
  }

  Server& set_tcp_tuning(const TcpTuning& tuning) {
    tcp_tuning_ = tuning;
    return *this;
  }

  Server& set_digest(DigestFn fn) {
    digest_fn_ = std::move(fn);
    return *this;
  }

  uint16_t port() const { return port_; }
  bool is_running() const { return is_running_.load(std::memory_order_acquire); }

  const ServerMetrics& metrics() const { return metrics_; }

  static constexpr size_t kMaxConnections = 256;

 private:
  uint16_t port_;
  std::string bind_addr_;
  int server_sock_ = -1;
  int wake_fd_ = -1;
  std::atomic<bool> is_running_{false};
  std::atomic<bool> stop_requested_{false};

  size_t num_workers_ = kDefaultNumWorkers;
  size_t queue_capacity_ = kDefaultQueueCapacity;
  size_t max_connections_ = kMaxConnections;
  int poll_timeout_ms_ = 100;
  int read_timeout_ms_ = kFrameReadTimeoutMs;
  TcpTuning tcp_tuning_;
  DigestFn digest_fn_ = &digest;

  FixedVector<ConnPtr, kMaxConnections> connections_;
  uint64_t next_conn_id_ = 1;

  // listener + wakeup + one per connection
  std::array<pollfd, kMaxConnections + 2> poll_fds_{};

  ServerMetrics metrics_;

  void wake();
  void drain_wakeups();
  expected<void, ErrorCode> accept_connection(WorkQueue& queue);
  void handle_connection_io(ConnPtr& conn, const pollfd& pfd);
  void close_connection(ConnPtr& conn, ErrorCode reason);
  void enforce_read_timeouts();
  void remove_closed_connections();
  void apply_tcp_tuning(int fd);
};

// Split "host:port". An empty host means all interfaces. error(kInvalidAddress)
// if the colon is missing or the port is not a number in 1..65535.
expected<void, ErrorCode> parse_listen_address(std::string_view address, std::string* host, uint16_t* port);

// Bind listen_address ("host:port") and serve forever with num_workers
// workers. Returns only on a fatal listener error.
expected<void, ErrorCode> run(const std::string& listen_address, size_t num_workers = kDefaultNumWorkers);

}  // namespace taskd

#endif  // TASKD_SERVER_HPP_
