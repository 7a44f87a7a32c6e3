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


/**
 * @file connection.hpp
 * @brief Per-connection request/response state machine driven by the reactor.
 *
 * The connection never blocks: reads land in a ring buffer, a frame is
 * assembled incrementally, the decoded request is offered to the dispatch
 * queue and the reply is picked up from a one-shot when the reactor is woken.
 * Only one request is in flight per connection; bytes sent early stay
 * buffered until the response has been written.
 */

#ifndef TASKD_CONNECTION_HPP_
#define TASKD_CONNECTION_HPP_

#include "frame.hpp"
#include "message.hpp"
#include "metrics.hpp"
#include "oneshot.hpp"
#include "protocol_hsm.hpp"
#include "utils.hpp"
#include "vocabulary.hpp"
#include "worker_pool.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <vector>

#include <sockpp/tcp_socket.h>

namespace taskd {

class alignas(kCacheLine) Connection {
 public:
  static constexpr size_t kRxBufferSize = 4096;

  using ConnPtr = std::shared_ptr<Connection>;
  using WakeFn = std::function<void()>;

  // fd must already be non-blocking. wake is handed to every one-shot this
  // connection creates.
  Connection(uint64_t id, int fd, WorkQueue& queue, ServerMetrics& metrics, WakeFn wake,
             int read_timeout_ms = kFrameReadTimeoutMs);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // --- Reactor I/O ---

  // Readable event. error(kConnectionClosed) on peer close, error(kSocketError)
  // on socket failure, or the decode error of a bad frame.
  expected<void, ErrorCode> handle_read();

  // Writable event. error(kSocketError) if the write fails.
  expected<void, ErrorCode> handle_write();

  // Reactor was woken by a worker.
  expected<void, ErrorCode> handle_wakeup() { return ops_->on_wakeup(*this); }

  bool wants_read() const { return get_state() == ConnectionState::kAwaitRequest && rx_buffer_.available() > 0; }
  bool wants_write() const { return get_state() == ConnectionState::kWriteResponse && tx_offset_ < tx_.size(); }

  bool is_read_timed_out() const {
    if (get_state() != ConnectionState::kAwaitRequest) return false;
    auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - frame_started_at_).count();
    return elapsed >= read_timeout_ms_;
  }

  void close();
  bool is_closed() const { return get_state() == ConnectionState::kClosed || !socket_.is_open(); }

  int get_fd() const { return socket_.handle(); }
  uint64_t get_id() const { return id_; }
  ConnectionState get_state() const { return ops_->state; }
  ErrorCode get_last_error() const { return last_error_code_; }

  // --- Used by the state handlers ---

  void transition_to_state(ConnectionState state);
  expected<void, ErrorCode> parse_frames();
  expected<void, ErrorCode> try_dispatch();
  expected<void, ErrorCode> poll_reply();
  void queue_response(const ProtocolMessage& msg);

 private:
  using SteadyClock = std::chrono::steady_clock;
  using TimePoint = SteadyClock::time_point;

  uint64_t id_;
  sockpp::tcp_socket socket_;
  WorkQueue& queue_;
  ServerMetrics& metrics_;
  WakeFn wake_;
  int read_timeout_ms_;

  RingBuffer<uint8_t, kRxBufferSize> rx_buffer_;
  FrameReader reader_;
  std::vector<uint8_t> tx_;
  size_t tx_offset_ = 0;

  const StateOps* ops_ = nullptr;
  optional<WorkItem> pending_;
  OneShotReceiver<ProtocolMessage> reply_;

  ErrorCode last_error_code_ = ErrorCode::kOk;
  TimePoint frame_started_at_ = SteadyClock::now();

  expected<void, ErrorCode> fail(ErrorCode code);
};

}  // namespace taskd

#endif  // TASKD_CONNECTION_HPP_
