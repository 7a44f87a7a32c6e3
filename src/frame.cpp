#include "taskd/frame.hpp"

#include <cerrno>
#include <cstring>

#include <algorithm>
#include <chrono>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "taskd/utils.hpp"

namespace taskd {

expected<uint32_t, ErrorCode> decode_header(const uint8_t* data, size_t len) {
  if (data == nullptr || len < kMinPacketSize) {
    return expected<uint32_t, ErrorCode>::error(ErrorCode::kFrameTooShort);
  }
  return expected<uint32_t, ErrorCode>::success(be::load_u32(data));
}

expected<std::vector<uint8_t>, ErrorCode> encode_frame(const std::vector<uint8_t>& payload) {
  if (payload.size() > kMaxPacketSize) {
    return expected<std::vector<uint8_t>, ErrorCode>::error(ErrorCode::kFrameTooLarge);
  }

  std::vector<uint8_t> frame(kMinPacketSize + payload.size());
  be::store_u32(frame.data(), static_cast<uint32_t>(payload.size()));
  if (!payload.empty()) {
    std::memcpy(frame.data() + kMinPacketSize, payload.data(), payload.size());
  }
  return expected<std::vector<uint8_t>, ErrorCode>::success(std::move(frame));
}

// ============================================================================
// FrameReader
// ============================================================================

expected<FrameReader::Status, ErrorCode> FrameReader::feed(const uint8_t* data, size_t len,
                                                           size_t* consumed) {
  size_t pos = 0;

  if (header_len_ < kMinPacketSize) {
    size_t take = std::min(kMinPacketSize - header_len_, len);
    std::memcpy(header_.data() + header_len_, data, take);
    header_len_ += take;
    pos += take;

    if (header_len_ < kMinPacketSize) {
      *consumed = pos;
      return expected<Status, ErrorCode>::success(Status::kNeedMore);
    }

    auto header = decode_header(header_.data(), header_.size());
    if (!header) {
      *consumed = pos;
      return expected<Status, ErrorCode>::error(header.get_error());
    }
    length_ = header.value();
    if (length_ > kMaxPacketSize) {
      *consumed = pos;
      return expected<Status, ErrorCode>::error(ErrorCode::kFrameTooLarge);
    }
    payload_.reserve(length_);
  }

  size_t want = length_ - payload_.size();
  size_t take = std::min(want, len - pos);
  payload_.insert(payload_.end(), data + pos, data + pos + take);
  pos += take;

  *consumed = pos;
  if (payload_.size() == length_) {
    return expected<Status, ErrorCode>::success(Status::kComplete);
  }
  return expected<Status, ErrorCode>::success(Status::kNeedMore);
}

std::vector<uint8_t> FrameReader::take_payload() {
  std::vector<uint8_t> out;
  out.swap(payload_);
  reset();
  return out;
}

void FrameReader::reset() {
  header_len_ = 0;
  length_ = 0;
  payload_.clear();
  payload_.shrink_to_fit();
}

// ============================================================================
// Blocking reader
// ============================================================================

namespace {

using SteadyClock = std::chrono::steady_clock;

// Read exactly len bytes before the deadline.
expected<void, ErrorCode> read_exact(int fd, uint8_t* buf, size_t len, SteadyClock::time_point deadline) {
  size_t got = 0;
  while (got < len) {
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now()).count();
    if (remaining <= 0) {
      return expected<void, ErrorCode>::error(ErrorCode::kTimeout);
    }

    pollfd pfd{fd, POLLIN, 0};
    int ret = ::poll(&pfd, 1, static_cast<int>(remaining));
    if (ret < 0) {
      if (errno == EINTR) continue;
      return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
    }
    if (ret == 0) {
      return expected<void, ErrorCode>::error(ErrorCode::kTimeout);
    }

    ssize_t n = ::recv(fd, buf + got, len - got, 0);
    if (n > 0) {
      got += static_cast<size_t>(n);
    } else if (n == 0) {
      return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
    } else {
      int err = errno;
      if (err == EINTR || err == EAGAIN || err == EWOULDBLOCK) continue;
      if (err == ECONNRESET) {
        return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
      }
      return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
    }
  }
  return expected<void, ErrorCode>::success();
}

}  // namespace

expected<std::vector<uint8_t>, ErrorCode> read_frame(int fd, int timeout_ms) {
  using Result = expected<std::vector<uint8_t>, ErrorCode>;
  const auto deadline = SteadyClock::now() + std::chrono::milliseconds(timeout_ms);

  uint8_t header[kMinPacketSize];
  auto r = read_exact(fd, header, sizeof(header), deadline);
  if (!r) return Result::error(r.get_error());

  auto length = decode_header(header, sizeof(header));
  if (!length) return Result::error(length.get_error());
  if (length.value() > kMaxPacketSize) {
    return Result::error(ErrorCode::kFrameTooLarge);
  }

  std::vector<uint8_t> payload(length.value());
  if (!payload.empty()) {
    r = read_exact(fd, payload.data(), payload.size(), deadline);
    if (!r) return Result::error(r.get_error());
  }
  return Result::success(std::move(payload));
}

}  // namespace taskd
