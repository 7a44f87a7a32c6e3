#include "taskd/message.hpp"

#include <cstring>

#include "taskd/frame.hpp"
#include "taskd/utils.hpp"

namespace taskd {

namespace {

enum class MessageTag : uint32_t { kTaskRequest = 0, kTaskResponse = 1 };
enum class RequestTag : uint32_t { kHashPacket = 0 };

struct AlgorithmName {
  HashAlgorithm algorithm;
  const char* name;
};

constexpr AlgorithmName kAlgorithmNames[] = {
    {HashAlgorithm::kSha224, "sha224"},         {HashAlgorithm::kSha256, "sha256"},
    {HashAlgorithm::kSha384, "sha384"},         {HashAlgorithm::kSha512, "sha512"},
    {HashAlgorithm::kSha512_224, "sha512-224"}, {HashAlgorithm::kSha512_256, "sha512-256"},
    {HashAlgorithm::kSha3_224, "sha3-224"},     {HashAlgorithm::kSha3_256, "sha3-256"},
    {HashAlgorithm::kSha3_384, "sha3-384"},     {HashAlgorithm::kSha3_512, "sha3-512"},
    {HashAlgorithm::kShake128, "shake128"},     {HashAlgorithm::kShake256, "shake256"},
    {HashAlgorithm::kBlake3, "blake3"},         {HashAlgorithm::kUnimplemented, "unimplemented"},
};

// ============================================================================
// ByteWriter / ByteReader
// ============================================================================

class ByteWriter {
 public:
  explicit ByteWriter(std::vector<uint8_t>& out) : out_(out) {}

  void put_u32(uint32_t v) {
    uint8_t buf[4];
    be::store_u32(buf, v);
    out_.insert(out_.end(), buf, buf + sizeof(buf));
  }

  void put_string(const std::string& s) {
    uint8_t buf[8];
    be::store_u64(buf, static_cast<uint64_t>(s.size()));
    out_.insert(out_.end(), buf, buf + sizeof(buf));
    out_.insert(out_.end(), s.begin(), s.end());
  }

 private:
  std::vector<uint8_t>& out_;
};

class ByteReader {
 public:
  ByteReader(const uint8_t* data, size_t len) : data_(data), len_(len) {}

  bool get_u32(uint32_t* v) {
    if (remaining() < 4) return false;
    *v = be::load_u32(data_ + pos_);
    pos_ += 4;
    return true;
  }

  // The declared length is checked against the remaining bytes before the
  // string is allocated.
  bool get_string(std::string* s) {
    if (remaining() < 8) return false;
    uint64_t n = be::load_u64(data_ + pos_);
    pos_ += 8;
    if (n > remaining()) return false;
    if (!is_valid_utf8(data_ + pos_, static_cast<size_t>(n))) return false;
    s->assign(reinterpret_cast<const char*>(data_ + pos_), static_cast<size_t>(n));
    pos_ += static_cast<size_t>(n);
    return true;
  }

  size_t remaining() const { return len_ - pos_; }

 private:
  const uint8_t* data_;
  size_t len_;
  size_t pos_ = 0;
};

void write_packet(ByteWriter& w, const HashingPacket& packet) {
  w.put_u32(static_cast<uint32_t>(packet.algorithm()));
  w.put_u32(static_cast<uint32_t>(packet.path().kind()));
  w.put_string(packet.path().value());
}

void write_response(ByteWriter& w, const TaskResponse& response) {
  w.put_u32(static_cast<uint32_t>(response.kind()));
  if (response.ok()) {
    w.put_string(response.digest());
  }
}

using MessageResult = expected<ProtocolMessage, ErrorCode>;

MessageResult malformed() { return MessageResult::error(ErrorCode::kMalformed); }

MessageResult read_request(ByteReader& r) {
  uint32_t tag = 0;
  if (!r.get_u32(&tag) || tag != static_cast<uint32_t>(RequestTag::kHashPacket)) {
    return malformed();
  }

  uint32_t algorithm = 0;
  uint32_t path_kind = 0;
  std::string path;
  if (!r.get_u32(&algorithm) || !r.get_u32(&path_kind) || !r.get_string(&path)) {
    return malformed();
  }

  switch (static_cast<FilePath::Kind>(path_kind)) {
    case FilePath::Kind::kLocal:
      return MessageResult::success(
          make_request(HashingPacket(algorithm_from_wire(algorithm), FilePath::local(std::move(path)))));
    case FilePath::Kind::kRemote:
      return MessageResult::success(
          make_request(HashingPacket(algorithm_from_wire(algorithm), FilePath::remote(std::move(path)))));
  }
  return malformed();
}

MessageResult read_response(ByteReader& r) {
  uint32_t kind = 0;
  if (!r.get_u32(&kind)) return malformed();

  switch (static_cast<TaskResponse::Kind>(kind)) {
    case TaskResponse::Kind::kSuccess: {
      std::string digest;
      if (!r.get_string(&digest)) return malformed();
      return MessageResult::success(make_response(TaskResponse::success(std::move(digest))));
    }
    case TaskResponse::Kind::kFailed:
      return MessageResult::success(make_response(TaskResponse::failed()));
  }
  return malformed();
}

}  // namespace

// ============================================================================
// HashAlgorithm
// ============================================================================

HashAlgorithm algorithm_from_wire(uint32_t value) {
  if (value > static_cast<uint32_t>(HashAlgorithm::kUnimplemented)) {
    return HashAlgorithm::kUnimplemented;
  }
  return static_cast<HashAlgorithm>(value);
}

const char* algorithm_name(HashAlgorithm algorithm) {
  for (const auto& entry : kAlgorithmNames) {
    if (entry.algorithm == algorithm) return entry.name;
  }
  return "unimplemented";
}

optional<HashAlgorithm> parse_algorithm(std::string_view name) {
  for (const auto& entry : kAlgorithmNames) {
    if (name == entry.name) return entry.algorithm;
  }
  return {};
}

// ============================================================================
// (De)serialization
// ============================================================================

std::vector<uint8_t> serialize(const ProtocolMessage& msg) {
  std::vector<uint8_t> out;
  ByteWriter w(out);

  if (const auto* request = std::get_if<TaskRequest>(&msg)) {
    w.put_u32(static_cast<uint32_t>(MessageTag::kTaskRequest));
    w.put_u32(static_cast<uint32_t>(RequestTag::kHashPacket));
    write_packet(w, std::get<HashingPacket>(*request));
  } else {
    w.put_u32(static_cast<uint32_t>(MessageTag::kTaskResponse));
    write_response(w, std::get<TaskResponse>(msg));
  }
  return out;
}

expected<ProtocolMessage, ErrorCode> deserialize(const uint8_t* data, size_t len) {
  ByteReader r(data, len);

  uint32_t tag = 0;
  if (!r.get_u32(&tag)) return malformed();

  MessageResult result = malformed();
  switch (static_cast<MessageTag>(tag)) {
    case MessageTag::kTaskRequest:
      result = read_request(r);
      break;
    case MessageTag::kTaskResponse:
      result = read_response(r);
      break;
    default:
      return malformed();
  }

  if (result && r.remaining() != 0) {
    return malformed();
  }
  return result;
}

expected<std::vector<uint8_t>, ErrorCode> encode_message(const ProtocolMessage& msg) {
  return encode_frame(serialize(msg));
}

expected<ProtocolMessage, ErrorCode> decode_message(int fd, int timeout_ms) {
  auto payload = read_frame(fd, timeout_ms);
  if (!payload) {
    return expected<ProtocolMessage, ErrorCode>::error(payload.get_error());
  }
  return deserialize(payload.value());
}

}  // namespace taskd
