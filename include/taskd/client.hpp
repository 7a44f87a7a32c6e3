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
 * @file client.hpp
 * @brief Blocking request/response client for the task protocol.
 */

#ifndef TASKD_CLIENT_HPP_
#define TASKD_CLIENT_HPP_

#include "frame.hpp"
#include "message.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <string>

#include <sockpp/tcp_socket.h>

namespace taskd {

class Client {
 public:
  // Resolve host and connect. error(kInvalidAddress) if host does not
  // resolve, error(kSocketError) if no address accepts the connection.
  static expected<Client, ErrorCode> connect(const std::string& host, uint16_t port);

  Client(Client&&) = default;
  Client& operator=(Client&&) = default;

  // Send one request and wait for its response.
  expected<TaskResponse, ErrorCode> request(const HashingPacket& packet, int timeout_ms = kFrameReadTimeoutMs);

  expected<void, ErrorCode> send_message(const ProtocolMessage& msg);
  expected<ProtocolMessage, ErrorCode> receive_message(int timeout_ms = kFrameReadTimeoutMs);

  // Write raw bytes, bypassing framing.
  expected<void, ErrorCode> send_bytes(const uint8_t* data, size_t len);

  int get_fd() const { return socket_.handle(); }
  bool is_open() const { return socket_.is_open(); }
  void close();

 private:
  explicit Client(sockpp::tcp_socket&& sock) : socket_(std::move(sock)) {}

  sockpp::tcp_socket socket_;
};

}  // namespace taskd

#endif  // TASKD_CLIENT_HPP_
