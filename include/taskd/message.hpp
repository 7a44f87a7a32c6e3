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
 * @file message.hpp
 * @brief Request/response message model carried inside a frame payload.
 *
 * Wire layout (all integers big-endian, fixed width):
 *
 *   ProtocolMessage := u32 tag (0 TaskRequest, 1 TaskResponse) || body
 *   TaskRequest     := u32 tag (0 HashPacket) || HashingPacket
 *   HashingPacket   := u32 algorithm || FilePath
 *   FilePath        := u32 tag (0 Local, 1 Remote) || String
 *   TaskResponse    := u32 tag (0 Success, 1 Failed) || [String]
 *   String          := u64 length || UTF-8 bytes
 *
 * Unknown outer tags are hard failures. An unknown algorithm value decodes to
 * HashAlgorithm::kUnimplemented so newer clients degrade gracefully.
 */

#ifndef TASKD_MESSAGE_HPP_
#define TASKD_MESSAGE_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace taskd {

// ============================================================================
// HashAlgorithm
// ============================================================================

enum class HashAlgorithm : uint32_t {
  kSha224 = 0,
  kSha256 = 1,
  kSha384 = 2,
  kSha512 = 3,
  kSha512_224 = 4,
  kSha512_256 = 5,
  kSha3_224 = 6,
  kSha3_256 = 7,
  kSha3_384 = 8,
  kSha3_512 = 9,
  kShake128 = 10,
  kShake256 = 11,
  kBlake3 = 12,
  kUnimplemented = 13
};

// Wire value to enum; anything out of range maps to kUnimplemented.
HashAlgorithm algorithm_from_wire(uint32_t value);

const char* algorithm_name(HashAlgorithm algorithm);

// Parse a name as printed by algorithm_name() ("sha256", "sha3-256", ...).
optional<HashAlgorithm> parse_algorithm(std::string_view name);

// ============================================================================
// FilePath
// ============================================================================

class FilePath {
 public:
  enum class Kind : uint32_t { kLocal = 0, kRemote = 1 };

  static FilePath local(std::string path) { return FilePath(Kind::kLocal, std::move(path)); }
  static FilePath remote(std::string url) { return FilePath(Kind::kRemote, std::move(url)); }

  Kind kind() const { return kind_; }
  bool is_remote() const { return kind_ == Kind::kRemote; }
  const std::string& value() const { return value_; }

  bool operator==(const FilePath& other) const { return kind_ == other.kind_ && value_ == other.value_; }
  bool operator!=(const FilePath& other) const { return !(*this == other); }

 private:
  FilePath(Kind kind, std::string value) : kind_(kind), value_(std::move(value)) {}

  Kind kind_;
  std::string value_;
};

// ============================================================================
// HashingPacket - immutable once constructed
// ============================================================================

class HashingPacket {
 public:
  HashingPacket(HashAlgorithm algorithm, FilePath path) : algorithm_(algorithm), path_(std::move(path)) {}

  HashAlgorithm algorithm() const { return algorithm_; }
  const FilePath& path() const { return path_; }

  bool operator==(const HashingPacket& other) const {
    return algorithm_ == other.algorithm_ && path_ == other.path_;
  }
  bool operator!=(const HashingPacket& other) const { return !(*this == other); }

 private:
  HashAlgorithm algorithm_;
  FilePath path_;
};

// New task kinds are added as further alternatives.
using TaskRequest = std::variant<HashingPacket>;

// ============================================================================
// TaskResponse - Success(hex digest) | Failed (opaque)
// ============================================================================

class TaskResponse {
 public:
  enum class Kind : uint32_t { kSuccess = 0, kFailed = 1 };

  static TaskResponse success(std::string hex_digest) {
    return TaskResponse(Kind::kSuccess, std::move(hex_digest));
  }
  static TaskResponse failed() { return TaskResponse(Kind::kFailed, std::string()); }

  Kind kind() const { return kind_; }
  bool ok() const { return kind_ == Kind::kSuccess; }
  // Empty for kFailed.
  const std::string& digest() const { return digest_; }

  bool operator==(const TaskResponse& other) const { return kind_ == other.kind_ && digest_ == other.digest_; }
  bool operator!=(const TaskResponse& other) const { return !(*this == other); }

 private:
  TaskResponse(Kind kind, std::string digest) : kind_(kind), digest_(std::move(digest)) {}

  Kind kind_;
  std::string digest_;
};

using ProtocolMessage = std::variant<TaskRequest, TaskResponse>;

inline ProtocolMessage make_request(HashingPacket packet) { return ProtocolMessage(TaskRequest(std::move(packet))); }

inline ProtocolMessage make_response(TaskResponse response) { return ProtocolMessage(std::move(response)); }

// ============================================================================
// (De)serialization
// ============================================================================

std::vector<uint8_t> serialize(const ProtocolMessage& msg);

// Returns error(kMalformed) on unknown outer tags, truncation, oversized
// string lengths, invalid UTF-8 or trailing bytes.
expected<ProtocolMessage, ErrorCode> deserialize(const uint8_t* data, size_t len);

inline expected<ProtocolMessage, ErrorCode> deserialize(const std::vector<uint8_t>& payload) {
  return deserialize(payload.data(), payload.size());
}

// encode_frame(serialize(msg)); error(kFrameTooLarge) if it does not fit.
expected<std::vector<uint8_t>, ErrorCode> encode_message(const ProtocolMessage& msg);

// deserialize(read_frame(fd)); the frame read is bounded by timeout_ms.
expected<ProtocolMessage, ErrorCode> decode_message(int fd, int timeout_ms);

}  // namespace taskd

#endif  // TASKD_MESSAGE_HPP_
