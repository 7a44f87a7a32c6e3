#include "taskd/connection.hpp"

#include <cerrno>
#include <cstring>

#include <string>

#include <sys/socket.h>
#include <sys/uio.h>

#include "taskd/log.hpp"

namespace taskd {

// ============================================================================
// State handlers
// ============================================================================

namespace {

expected<void, ErrorCode> ok() { return expected<void, ErrorCode>::success(); }

expected<void, ErrorCode> await_request_on_data(Connection& conn) { return conn.parse_frames(); }

expected<void, ErrorCode> dispatching_on_wakeup(Connection& conn) { return conn.try_dispatch(); }

expected<void, ErrorCode> await_result_on_wakeup(Connection& conn) { return conn.poll_reply(); }

expected<void, ErrorCode> write_response_on_drained(Connection& conn) {
  conn.transition_to_state(ConnectionState::kAwaitRequest);
  // A request sent before the response was flushed is already buffered.
  return conn.parse_frames();
}

expected<void, ErrorCode> ignore(Connection&) { return ok(); }

expected<void, ErrorCode> closed(Connection&) { return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed); }

}  // namespace

const StateOps kAwaitRequestOps = {ConnectionState::kAwaitRequest, await_request_on_data, ignore, ignore};
const StateOps kDispatchingOps = {ConnectionState::kDispatching, ignore, dispatching_on_wakeup, ignore};
const StateOps kAwaitResultOps = {ConnectionState::kAwaitResult, ignore, await_result_on_wakeup, ignore};
const StateOps kWriteResponseOps = {ConnectionState::kWriteResponse, ignore, ignore, write_response_on_drained};
const StateOps kClosedOps = {ConnectionState::kClosed, closed, closed, closed};

// ============================================================================
// Connection
// ============================================================================

Connection::Connection(uint64_t id, int fd, WorkQueue& queue, ServerMetrics& metrics, WakeFn wake,
                       int read_timeout_ms)
    : id_(id),
      socket_(fd),
      queue_(queue),
      metrics_(metrics),
      wake_(std::move(wake)),
      read_timeout_ms_(read_timeout_ms),
      ops_(&kAwaitRequestOps) {}

Connection::~Connection() {
  if (socket_.is_open()) socket_.close();
}

expected<void, ErrorCode> Connection::handle_read() {
  struct iovec iov[2];
  size_t iov_count = rx_buffer_.fill_iovec_write(iov, 2);
  if (iov_count == 0) {
    // Receive buffer full outside AwaitRequest; leave the rest in the kernel.
    return ok();
  }

  ssize_t n = ::readv(socket_.handle(), iov, static_cast<int>(iov_count));
  if (n > 0) {
    rx_buffer_.commit_write(static_cast<size_t>(n));
    return ops_->on_data(*this);
  } else if (n == 0) {
    return fail(ErrorCode::kConnectionClosed);
  }

  int err = errno;
  if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
    return ok();
  }
  if (err == ECONNRESET) {
    return fail(ErrorCode::kConnectionClosed);
  }
  metric_inc(metrics_.socket_errors);
  TASKD_LOG_WARN("Connection " + std::to_string(id_) + " read error: " + std::strerror(err));
  return fail(ErrorCode::kSocketError);
}

expected<void, ErrorCode> Connection::handle_write() {
  while (tx_offset_ < tx_.size()) {
    ssize_t n = ::send(socket_.handle(), tx_.data() + tx_offset_, tx_.size() - tx_offset_, MSG_NOSIGNAL);
    if (n > 0) {
      tx_offset_ += static_cast<size_t>(n);
      continue;
    }
    int err = errno;
    if (n < 0 && err == EINTR) continue;
    if (n < 0 && (err == EAGAIN || err == EWOULDBLOCK)) return ok();

    metric_inc(metrics_.socket_errors);
    TASKD_LOG_WARN("Connection " + std::to_string(id_) + " write error: " + std::strerror(err));
    return fail(ErrorCode::kSocketError);
  }

  tx_.clear();
  tx_offset_ = 0;
  return ops_->on_drained(*this);
}

void Connection::close() {
  if (get_state() == ConnectionState::kClosed) return;
  transition_to_state(ConnectionState::kClosed);
  pending_.reset();
  reply_.close();
  if (socket_.is_open()) socket_.close();
}

void Connection::transition_to_state(ConnectionState state) {
  TASKD_LOG_DEBUG("Connection " + std::to_string(id_) + ": " + connection_state_name(get_state()) + " -> " +
                  connection_state_name(state));
  switch (state) {
    case ConnectionState::kAwaitRequest:
      ops_ = &kAwaitRequestOps;
      reader_.reset();
      frame_started_at_ = SteadyClock::now();
      break;
    case ConnectionState::kDispatching:
      ops_ = &kDispatchingOps;
      break;
    case ConnectionState::kAwaitResult:
      ops_ = &kAwaitResultOps;
      break;
    case ConnectionState::kWriteResponse:
      ops_ = &kWriteResponseOps;
      break;
    case ConnectionState::kClosed:
      ops_ = &kClosedOps;
      break;
  }
}

expected<void, ErrorCode> Connection::parse_frames() {
  while (get_state() == ConnectionState::kAwaitRequest && !rx_buffer_.empty()) {
    size_t len = 0;
    const uint8_t* data = rx_buffer_.read_ptr(&len);

    size_t consumed = 0;
    auto status = reader_.feed(data, len, &consumed);
    rx_buffer_.advance(consumed);
    if (!status) {
      metric_inc(metrics_.frame_errors);
      TASKD_LOG_WARN("Connection " + std::to_string(id_) + " bad frame: " + error_code_name(status.get_error()));
      return fail(status.get_error());
    }
    if (status.value() == FrameReader::Status::kNeedMore) continue;

    auto msg = deserialize(reader_.take_payload());
    if (!msg) {
      metric_inc(metrics_.frame_errors);
      TASKD_LOG_WARN("Connection " + std::to_string(id_) + " bad payload: " + error_code_name(msg.get_error()));
      return fail(msg.get_error());
    }

    if (std::holds_alternative<TaskResponse>(msg.value())) {
      TASKD_LOG_DEBUG("Connection " + std::to_string(id_) + " sent a TaskResponse, ignoring");
      transition_to_state(ConnectionState::kAwaitRequest);
      continue;
    }

    const auto& packet = std::get<HashingPacket>(std::get<TaskRequest>(msg.value()));
    TASKD_LOG_DEBUG("Connection " + std::to_string(id_) + " request " + algorithm_name(packet.algorithm()));

    auto channel = make_oneshot<ProtocolMessage>(wake_);
    reply_ = std::move(channel.second);
    pending_.emplace(WorkItem{packet, std::move(channel.first)});
    transition_to_state(ConnectionState::kDispatching);
    return try_dispatch();
  }
  return ok();
}

expected<void, ErrorCode> Connection::try_dispatch() {
  TASKD_ASSERT(pending_);
  auto pushed = queue_.try_push(pending_.value());
  if (pushed) {
    pending_.reset();
    transition_to_state(ConnectionState::kAwaitResult);
    return poll_reply();
  }

  if (pushed.get_error() == ErrorCode::kQueueFull) {
    // Retried when a worker pops an item and wakes the reactor.
    return ok();
  }

  TASKD_LOG_WARN("Connection " + std::to_string(id_) + " dispatch failed: " + error_code_name(pushed.get_error()));
  pending_.reset();
  reply_.close();
  queue_response(make_response(TaskResponse::failed()));
  return ok();
}

expected<void, ErrorCode> Connection::poll_reply() {
  optional<ProtocolMessage> msg;
  switch (reply_.try_receive(&msg)) {
    case OneShotStatus::kPending:
      return ok();
    case OneShotStatus::kReady:
      reply_.close();
      queue_response(msg.value());
      return ok();
    case OneShotStatus::kSenderDropped:
      TASKD_LOG_WARN("Connection " + std::to_string(id_) + " reply dropped by worker");
      reply_.close();
      queue_response(make_response(TaskResponse::failed()));
      return ok();
  }
  return ok();
}

void Connection::queue_response(const ProtocolMessage& msg) {
  auto frame = encode_message(msg);
  if (!frame) {
    TASKD_LOG_WARN("Connection " + std::to_string(id_) + " response too large, sending Failed");
    frame = encode_message(make_response(TaskResponse::failed()));
  }
  tx_ = std::move(frame).value();
  tx_offset_ = 0;
  transition_to_state(ConnectionState::kWriteResponse);
}

expected<void, ErrorCode> Connection::fail(ErrorCode code) {
  last_error_code_ = code;
  return expected<void, ErrorCode>::error(code);
}

}  // namespace taskd
