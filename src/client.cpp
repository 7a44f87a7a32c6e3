#include "taskd/client.hpp"

#include <cerrno>
#include <cstring>

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include "taskd/log.hpp"

namespace taskd {

expected<Client, ErrorCode> Client::connect(const std::string& host, uint16_t port) {
  using Result = expected<Client, ErrorCode>;

  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo* res = nullptr;
  std::string service = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
  if (rc != 0) {
    TASKD_LOG_DEBUG("getaddrinfo " + host + ": " + ::gai_strerror(rc));
    return Result::error(ErrorCode::kInvalidAddress);
  }

  int fd = -1;
  for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) continue;
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
    TASKD_LOG_DEBUG("connect " + host + ":" + service + ": " + std::strerror(errno));
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(res);

  if (fd < 0) {
    return Result::error(ErrorCode::kSocketError);
  }

  int opt = 1;
  if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0) {
    TASKD_LOG_DEBUG(std::string("TCP_NODELAY failed: ") + std::strerror(errno));
  }
  return Result::success(Client(sockpp::tcp_socket(fd)));
}

expected<TaskResponse, ErrorCode> Client::request(const HashingPacket& packet, int timeout_ms) {
  using Result = expected<TaskResponse, ErrorCode>;

  auto sent = send_message(make_request(packet));
  if (!sent) return Result::error(sent.get_error());

  auto reply = receive_message(timeout_ms);
  if (!reply) return Result::error(reply.get_error());

  if (const auto* response = std::get_if<TaskResponse>(&reply.value())) {
    return Result::success(*response);
  }
  // A server never sends requests.
  return Result::error(ErrorCode::kMalformed);
}

expected<void, ErrorCode> Client::send_message(const ProtocolMessage& msg) {
  auto frame = encode_message(msg);
  if (!frame) return expected<void, ErrorCode>::error(frame.get_error());
  return send_bytes(frame.value().data(), frame.value().size());
}

expected<ProtocolMessage, ErrorCode> Client::receive_message(int timeout_ms) {
  return decode_message(socket_.handle(), timeout_ms);
}

expected<void, ErrorCode> Client::send_bytes(const uint8_t* data, size_t len) {
  size_t sent = 0;
  while (sent < len) {
    ssize_t n = ::send(socket_.handle(), data + sent, len - sent, MSG_NOSIGNAL);
    if (n > 0) {
      sent += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EPIPE || errno == ECONNRESET)) {
      return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
    }
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }
  return expected<void, ErrorCode>::success();
}

void Client::close() {
  if (socket_.is_open()) socket_.close();
}

}  // namespace taskd
