#include "taskd/frame.hpp"

#include <cstring>

#include <sys/socket.h>
#include <unistd.h>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <thread>
#include <vector>

using namespace taskd;

namespace {

struct SocketPair {
  int fds[2] = {-1, -1};
  SocketPair() { REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0); }
  ~SocketPair() {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
  }
  void close_writer() {
    ::close(fds[1]);
    fds[1] = -1;
  }
  void write_all(const std::vector<uint8_t>& bytes) {
    REQUIRE(::write(fds[1], bytes.data(), bytes.size()) == static_cast<ssize_t>(bytes.size()));
  }
};

}  // namespace

// ============================================================================
// Header decoding
// ============================================================================

TEST_CASE("Frame header - big-endian length", "[frame]") {
  uint8_t header[] = {0x00, 0x01, 0x00, 0x02};
  auto len = decode_header(header, sizeof(header));
  REQUIRE(len.has_value());
  REQUIRE(len.value() == 65538);
}

TEST_CASE("Frame header - fewer than four bytes is too short", "[frame]") {
  uint8_t header[] = {0x00, 0x00, 0x00, 0x05};
  for (size_t n = 0; n < 4; ++n) {
    auto len = decode_header(header, n);
    REQUIRE_FALSE(len.has_value());
    REQUIRE(len.get_error() == ErrorCode::kFrameTooShort);
  }
}

// ============================================================================
// Encoding
// ============================================================================

TEST_CASE("Frame encode - prepends length", "[frame]") {
  std::vector<uint8_t> payload = {'a', 'b', 'c'};
  auto frame = encode_frame(payload);
  REQUIRE(frame.has_value());
  REQUIRE(frame.value() == std::vector<uint8_t>{0, 0, 0, 3, 'a', 'b', 'c'});
}

TEST_CASE("Frame encode - empty payload", "[frame]") {
  auto frame = encode_frame({});
  REQUIRE(frame.has_value());
  REQUIRE(frame.value() == std::vector<uint8_t>{0, 0, 0, 0});
}

TEST_CASE("Frame encode - limit is inclusive", "[frame]") {
  std::vector<uint8_t> at_limit(kMaxPacketSize, 0x5a);
  REQUIRE(encode_frame(at_limit).has_value());

  std::vector<uint8_t> over(kMaxPacketSize + 1, 0x5a);
  auto frame = encode_frame(over);
  REQUIRE_FALSE(frame.has_value());
  REQUIRE(frame.get_error() == ErrorCode::kFrameTooLarge);
}

// ============================================================================
// FrameReader (incremental)
// ============================================================================

TEST_CASE("FrameReader - byte at a time", "[frame]") {
  std::vector<uint8_t> bytes = {0, 0, 0, 4, 'w', 'x', 'y', 'z'};
  FrameReader reader;

  for (size_t i = 0; i < bytes.size(); ++i) {
    size_t consumed = 0;
    auto status = reader.feed(&bytes[i], 1, &consumed);
    REQUIRE(status.has_value());
    REQUIRE(consumed == 1);
    if (i + 1 < bytes.size()) {
      REQUIRE(status.value() == FrameReader::Status::kNeedMore);
    } else {
      REQUIRE(status.value() == FrameReader::Status::kComplete);
    }
  }

  REQUIRE(reader.take_payload() == std::vector<uint8_t>{'w', 'x', 'y', 'z'});
  REQUIRE_FALSE(reader.in_progress());
}

TEST_CASE("FrameReader - stops at frame boundary", "[frame]") {
  std::vector<uint8_t> bytes = {0, 0, 0, 1, 'a', 0, 0, 0, 1, 'b'};
  FrameReader reader;

  size_t consumed = 0;
  auto status = reader.feed(bytes.data(), bytes.size(), &consumed);
  REQUIRE(status.has_value());
  REQUIRE(status.value() == FrameReader::Status::kComplete);
  REQUIRE(consumed == 5);
  REQUIRE(reader.take_payload() == std::vector<uint8_t>{'a'});

  status = reader.feed(bytes.data() + consumed, bytes.size() - consumed, &consumed);
  REQUIRE(status.has_value());
  REQUIRE(status.value() == FrameReader::Status::kComplete);
  REQUIRE(reader.take_payload() == std::vector<uint8_t>{'b'});
}

TEST_CASE("FrameReader - zero length frame completes on header", "[frame]") {
  uint8_t bytes[] = {0, 0, 0, 0};
  FrameReader reader;
  size_t consumed = 0;
  auto status = reader.feed(bytes, sizeof(bytes), &consumed);
  REQUIRE(status.has_value());
  REQUIRE(status.value() == FrameReader::Status::kComplete);
  REQUIRE(reader.take_payload().empty());
}

TEST_CASE("FrameReader - oversized length rejected before allocating", "[frame]") {
  // 2,000,000 bytes declared
  uint8_t header[] = {0x00, 0x1e, 0x84, 0x80};
  FrameReader reader;
  size_t consumed = 0;
  auto status = reader.feed(header, sizeof(header), &consumed);
  REQUIRE_FALSE(status.has_value());
  REQUIRE(status.get_error() == ErrorCode::kFrameTooLarge);
  REQUIRE(reader.payload_capacity() == 0);
}

TEST_CASE("FrameReader - maximum length accepted", "[frame]") {
  uint8_t header[] = {0x00, 0x10, 0x00, 0x00};
  FrameReader reader;
  size_t consumed = 0;
  auto status = reader.feed(header, sizeof(header), &consumed);
  REQUIRE(status.has_value());
  REQUIRE(status.value() == FrameReader::Status::kNeedMore);
  REQUIRE(reader.declared_length() == kMaxPacketSize);
}

// ============================================================================
// Blocking read_frame
// ============================================================================

TEST_CASE("read_frame - complete frame", "[frame]") {
  SocketPair sp;
  sp.write_all({0, 0, 0, 2, 'h', 'i'});

  auto payload = read_frame(sp.fds[0], 1000);
  REQUIRE(payload.has_value());
  REQUIRE(payload.value() == std::vector<uint8_t>{'h', 'i'});
}

TEST_CASE("read_frame - payload split across writes", "[frame]") {
  SocketPair sp;
  ssize_t n1 = 0;
  ssize_t n2 = 0;
  std::thread writer([&] {
    uint8_t part1[] = {0, 0, 0, 3, 'a'};
    uint8_t part2[] = {'b', 'c'};
    n1 = ::write(sp.fds[1], part1, sizeof(part1));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    n2 = ::write(sp.fds[1], part2, sizeof(part2));
  });

  auto payload = read_frame(sp.fds[0], 2000);
  writer.join();
  REQUIRE(n1 == 5);
  REQUIRE(n2 == 2);
  REQUIRE(payload.has_value());
  REQUIRE(payload.value() == std::vector<uint8_t>{'a', 'b', 'c'});
}

TEST_CASE("read_frame - too large", "[frame]") {
  SocketPair sp;
  sp.write_all({0x00, 0x1e, 0x84, 0x80});

  auto payload = read_frame(sp.fds[0], 1000);
  REQUIRE_FALSE(payload.has_value());
  REQUIRE(payload.get_error() == ErrorCode::kFrameTooLarge);
}

TEST_CASE("read_frame - stalled payload times out", "[frame]") {
  SocketPair sp;
  sp.write_all({0x00, 0x00, 0xfd, 0xe8, 'x', 'y'});  // claims 65000

  auto start = std::chrono::steady_clock::now();
  auto payload = read_frame(sp.fds[0], 200);
  auto elapsed = std::chrono::steady_clock::now() - start;

  REQUIRE_FALSE(payload.has_value());
  REQUIRE(payload.get_error() == ErrorCode::kTimeout);
  REQUIRE(elapsed >= std::chrono::milliseconds(150));
}

TEST_CASE("read_frame - peer closes mid-frame", "[frame]") {
  SocketPair sp;
  sp.write_all({0, 0, 0, 10, 'p'});
  sp.close_writer();

  auto payload = read_frame(sp.fds[0], 1000);
  REQUIRE_FALSE(payload.has_value());
  REQUIRE(payload.get_error() == ErrorCode::kConnectionClosed);
}
