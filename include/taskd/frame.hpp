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
 * @file frame.hpp
 * @brief Length-prefixed frame codec.
 *
 * Frame := u32 length (big-endian) || payload[length]
 *
 * The declared length is validated against kMaxPacketSize before any payload
 * buffer is reserved, so a forged header cannot force a large allocation.
 */

#ifndef TASKD_FRAME_HPP_
#define TASKD_FRAME_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <array>
#include <vector>

namespace taskd {

static constexpr size_t kMaxPacketSize = 1024 * 1024;
static constexpr size_t kMinPacketSize = 4;  // header size
static constexpr int kFrameReadTimeoutMs = 5000;

// Decode the 4-byte big-endian length prefix.
// Returns error(kFrameTooShort) if fewer than kMinPacketSize bytes are given.
expected<uint32_t, ErrorCode> decode_header(const uint8_t* data, size_t len);

// Prepend the length prefix to payload.
// Returns error(kFrameTooLarge) if payload exceeds kMaxPacketSize.
expected<std::vector<uint8_t>, ErrorCode> encode_frame(const std::vector<uint8_t>& payload);

// ============================================================================
// FrameReader - incremental decoder fed from a connection's RX buffer
// ============================================================================

class FrameReader {
 public:
  enum class Status : uint8_t { kNeedMore, kComplete };

  // Consume bytes from data. Never consumes past the end of the current frame;
  // *consumed reports how many bytes were taken.
  // Returns error(kFrameTooLarge) as soon as the header declares more than
  // kMaxPacketSize, without reserving the payload.
  expected<Status, ErrorCode> feed(const uint8_t* data, size_t len, size_t* consumed);

  // Hand over the completed payload and reset for the next frame.
  std::vector<uint8_t> take_payload();

  void reset();

  // True once at least one byte of the current frame has been consumed.
  bool in_progress() const { return header_len_ > 0; }
  bool has_header() const { return header_len_ == kMinPacketSize; }
  uint32_t declared_length() const { return length_; }
  size_t payload_capacity() const { return payload_.capacity(); }

 private:
  std::array<uint8_t, kMinPacketSize> header_{};
  size_t header_len_ = 0;
  uint32_t length_ = 0;
  std::vector<uint8_t> payload_;
};

// ============================================================================
// Blocking reader (client side)
// ============================================================================

// Read one whole frame from a blocking or non-blocking fd. The header and
// payload reads share a single deadline of timeout_ms.
// Errors: kTimeout, kFrameTooLarge, kConnectionClosed (EOF), kSocketError.
expected<std::vector<uint8_t>, ErrorCode> read_frame(int fd, int timeout_ms = kFrameReadTimeoutMs);

}  // namespace taskd

#endif  // TASKD_FRAME_HPP_
