#include "taskd.hpp"

#include <csignal>
#include <cstdlib>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace taskd;
using namespace std::chrono_literals;

// ============================================================================
// Raw POSIX test client (for malformed and partial frames)
// ============================================================================

class RawTestClient {
 public:
  RawTestClient() = default;
  ~RawTestClient() { disconnect(); }

  bool connect(uint16_t port) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) return false;

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = inet_addr("127.0.0.1");

    if (::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
      ::close(fd_);
      fd_ = -1;
      return false;
    }
    return true;
  }

  bool send_raw(const std::vector<uint8_t>& bytes) {
    size_t sent = 0;
    while (sent < bytes.size()) {
      ssize_t n = ::send(fd_, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
      if (n <= 0) return false;
      sent += static_cast<size_t>(n);
    }
    return true;
  }

  bool send_message(const ProtocolMessage& msg) {
    auto frame = encode_message(msg);
    return frame.has_value() && send_raw(frame.value());
  }

  // True once the server has closed its side (EOF or reset) within timeout_ms.
  // Any bytes received before EOF are stored in received().
  bool wait_for_close(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
      pollfd pfd{fd_, POLLIN, 0};
      int ret = ::poll(&pfd, 1, static_cast<int>(left.count()) + 1);
      if (ret <= 0) continue;
      uint8_t buf[256];
      ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
      if (n <= 0) return true;
      received_.insert(received_.end(), buf, buf + n);
    }
    return false;
  }

  void disconnect() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int fd() const { return fd_; }
  const std::vector<uint8_t>& received() const { return received_; }

 private:
  int fd_ = -1;
  std::vector<uint8_t> received_;
};

// ============================================================================
// Test helpers
// ============================================================================

namespace {

class TempFile {
 public:
  explicit TempFile(const std::string& contents) {
    char name[] = "/tmp/taskd_it_XXXXXX";
    int fd = ::mkstemp(name);
    REQUIRE(fd >= 0);
    path_ = name;
    REQUIRE(::write(fd, contents.data(), contents.size()) == static_cast<ssize_t>(contents.size()));
    ::close(fd);
  }
  ~TempFile() { ::unlink(path_.c_str()); }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

constexpr const char* kAbcSha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

Client connect_client(uint16_t port) {
  auto client = Client::connect("127.0.0.1", port);
  REQUIRE(client.has_value());
  return std::move(client).value();
}

bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 2000ms) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

}  // namespace

// Runs the server on a background thread. Port 0 binds an ephemeral port so
// test cases never collide.
struct ServerFixture {
  Server server;
  std::thread server_thread;
  expected<void, ErrorCode> result = expected<void, ErrorCode>::success();

  ServerFixture() : server(0, "127.0.0.1") {
    server.set_max_connections(32);
    server.set_poll_timeout_ms(20);
    server.set_num_workers(4);
  }

  void start() {
    server_thread = std::thread([this]() { result = server.run(); });
    REQUIRE(wait_until([this] { return server.is_running(); }));
  }

  void stop() {
    server.stop();
    if (server_thread.joinable()) {
      server_thread.join();
    }
  }

  uint16_t port() const { return server.port(); }

  ~ServerFixture() { stop(); }
};

// ============================================================================
// Request / response
// ============================================================================

TEST_CASE("Integration - server start and stop", "[integration]") {
  ServerFixture fixture;
  fixture.start();
  REQUIRE(fixture.port() != 0);

  RawTestClient client;
  REQUIRE(client.connect(fixture.port()));
  client.disconnect();

  fixture.stop();
  REQUIRE(fixture.result.has_value());
  REQUIRE_FALSE(fixture.server.is_running());
}

TEST_CASE("Integration - SHA-256 of a local file", "[integration]") {
  TempFile file("abc");
  ServerFixture fixture;
  fixture.start();

  Client client = connect_client(fixture.port());
  auto response = client.request(HashingPacket(HashAlgorithm::kSha256, FilePath::local(file.path())));
  REQUIRE(response.has_value());
  REQUIRE(response.value().ok());
  REQUIRE(response.value().digest() == kAbcSha256);

  fixture.stop();
  REQUIRE(metric_get(fixture.server.metrics().processed_tasks) == 1);
}

TEST_CASE("Integration - remote path answers Failed", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  Client client = connect_client(fixture.port());
  auto response = client.request(HashingPacket(HashAlgorithm::kSha256, FilePath::remote("http://x")));
  REQUIRE(response.has_value());
  REQUIRE_FALSE(response.value().ok());
}

TEST_CASE("Integration - missing file and unimplemented algorithm answer Failed", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  Client client = connect_client(fixture.port());
  auto missing = client.request(HashingPacket(HashAlgorithm::kSha256, FilePath::local("/nonexistent/taskd")));
  REQUIRE(missing.has_value());
  REQUIRE_FALSE(missing.value().ok());

  // Same connection keeps serving after a Failed answer
  auto unimplemented = client.request(HashingPacket(HashAlgorithm::kUnimplemented, FilePath::local("/etc/hostname")));
  REQUIRE(unimplemented.has_value());
  REQUIRE_FALSE(unimplemented.value().ok());
}

TEST_CASE("Integration - SHAKE128 and BLAKE3 of a local file", "[integration]") {
  TempFile file("abc");
  ServerFixture fixture;
  fixture.start();

  Client client = connect_client(fixture.port());
  auto shake = client.request(HashingPacket(HashAlgorithm::kShake128, FilePath::local(file.path())));
  REQUIRE(shake.has_value());
  REQUIRE(shake.value().ok());
  REQUIRE(shake.value().digest() == "5881092dd818bf5cf8a3ddb793fbcba74097d5c526a6d35f97b83351940f2cc8");

  auto blake = client.request(HashingPacket(HashAlgorithm::kBlake3, FilePath::local(file.path())));
  REQUIRE(blake.has_value());
  REQUIRE(blake.value().ok());
  REQUIRE(blake.value().digest() == "6437b3ac38465133ffb63b75273a8db548c558465d79db03fd359c6cd5bd9d85");
}

TEST_CASE("Integration - sequential requests on one connection", "[integration]") {
  TempFile file("abc");
  ServerFixture fixture;
  fixture.start();

  Client client = connect_client(fixture.port());
  for (int i = 0; i < 20; ++i) {
    auto response = client.request(HashingPacket(HashAlgorithm::kSha256, FilePath::local(file.path())));
    REQUIRE(response.has_value());
    REQUIRE(response.value().digest() == kAbcSha256);
  }
}

TEST_CASE("Integration - back-to-back requests answered in order", "[integration]") {
  TempFile abc("abc");
  TempFile empty("");
  ServerFixture fixture;
  fixture.start();

  // Both frames are written before reading; the second waits in the buffer.
  Client client = connect_client(fixture.port());
  REQUIRE(client.send_message(make_request(HashingPacket(HashAlgorithm::kSha256, FilePath::local(abc.path())))));
  REQUIRE(client.send_message(make_request(HashingPacket(HashAlgorithm::kSha256, FilePath::local(empty.path())))));

  auto first = client.receive_message();
  auto second = client.receive_message();
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  REQUIRE(std::get<TaskResponse>(first.value()).digest() == kAbcSha256);
  REQUIRE(std::get<TaskResponse>(second.value()).digest() ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("Integration - client-sent TaskResponse is ignored", "[integration]") {
  TempFile file("abc");
  ServerFixture fixture;
  fixture.start();

  Client client = connect_client(fixture.port());
  REQUIRE(client.send_message(make_response(TaskResponse::success("bogus"))));
  auto response = client.request(HashingPacket(HashAlgorithm::kSha256, FilePath::local(file.path())));
  REQUIRE(response.has_value());
  REQUIRE(response.value().digest() == kAbcSha256);
}

TEST_CASE("Integration - concurrent clients each get their own answer", "[integration]") {
  constexpr int kClients = 12;
  std::vector<std::unique_ptr<TempFile>> files;
  for (int i = 0; i < kClients; ++i) {
    files.push_back(std::make_unique<TempFile>("file-" + std::to_string(i)));
  }

  ServerFixture fixture;
  fixture.start();

  std::vector<std::string> digests(kClients);
  std::vector<std::thread> threads;
  for (int i = 0; i < kClients; ++i) {
    threads.emplace_back([&, i] {
      auto client = Client::connect("127.0.0.1", fixture.port());
      if (!client) return;
      auto response = client.value().request(
          HashingPacket(HashAlgorithm::kSha256, FilePath::local(files[static_cast<size_t>(i)]->path())));
      if (response && response.value().ok()) digests[static_cast<size_t>(i)] = response.value().digest();
    });
  }
  for (auto& t : threads) t.join();

  for (int i = 0; i < kClients; ++i) {
    std::string contents = "file-" + std::to_string(i);
    auto expected_digest =
        digest_bytes(HashAlgorithm::kSha256, reinterpret_cast<const uint8_t*>(contents.data()), contents.size());
    REQUIRE(digests[static_cast<size_t>(i)] == expected_digest.value());
  }
}

TEST_CASE("Integration - saturated queue delays but delivers", "[integration]") {
  std::mutex mtx;
  std::condition_variable cv;
  bool release = false;

  ServerFixture fixture;
  fixture.server.set_num_workers(1).set_queue_capacity(1);
  fixture.server.set_digest([&](HashAlgorithm, const FilePath& path) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait_for(lock, 3s, [&] { return release; });
    return DigestResult::success(path.value());
  });
  fixture.start();

  // One in the worker, one in the queue, the rest wait in Dispatching.
  constexpr int kClients = 4;
  std::vector<Client> clients;
  for (int i = 0; i < kClients; ++i) {
    clients.push_back(connect_client(fixture.port()));
    REQUIRE(clients.back().send_message(
        make_request(HashingPacket(HashAlgorithm::kSha256, FilePath::local("p" + std::to_string(i))))));
  }

  std::this_thread::sleep_for(100ms);
  {
    std::lock_guard<std::mutex> lock(mtx);
    release = true;
  }
  cv.notify_all();

  for (int i = 0; i < kClients; ++i) {
    auto reply = clients[static_cast<size_t>(i)].receive_message();
    REQUIRE(reply.has_value());
    REQUIRE(std::get<TaskResponse>(reply.value()).digest() == "p" + std::to_string(i));
  }
}

namespace {

Server* g_signal_server = nullptr;

void stop_on_signal(int) {
  if (g_signal_server != nullptr) g_signal_server->stop();
}

}  // namespace

TEST_CASE("Integration - stop from a signal handler", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  struct sigaction action{};
  struct sigaction previous{};
  action.sa_handler = stop_on_signal;
  sigemptyset(&action.sa_mask);
  REQUIRE(::sigaction(SIGUSR1, &action, &previous) == 0);

  g_signal_server = &fixture.server;
  REQUIRE(::raise(SIGUSR1) == 0);
  bool stopped = wait_until([&] { return !fixture.server.is_running(); });
  g_signal_server = nullptr;
  ::sigaction(SIGUSR1, &previous, nullptr);

  REQUIRE(stopped);
  fixture.stop();
  REQUIRE(fixture.result.has_value());
}

TEST_CASE("Integration - server runs again after stop", "[integration]") {
  TempFile file("abc");
  ServerFixture fixture;

  for (int round = 0; round < 2; ++round) {
    fixture.start();
    Client client = connect_client(fixture.port());
    auto response = client.request(HashingPacket(HashAlgorithm::kSha256, FilePath::local(file.path())));
    REQUIRE(response.has_value());
    REQUIRE(response.value().digest() == kAbcSha256);
    client.close();
    fixture.stop();
    REQUIRE(fixture.result.has_value());
    REQUIRE_FALSE(fixture.server.is_running());
  }
  REQUIRE(metric_get(fixture.server.metrics().processed_tasks) == 2);
}

// ============================================================================
// Hostile input
// ============================================================================

TEST_CASE("Integration - stalled frame closed after read deadline", "[integration]") {
  ServerFixture fixture;
  fixture.server.set_read_timeout_ms(300);
  fixture.start();

  RawTestClient client;
  REQUIRE(client.connect(fixture.port()));
  // Claims 65000 bytes, sends two, then goes silent
  REQUIRE(client.send_raw({0x00, 0x00, 0xfd, 0xe8, 'x', 'y'}));

  auto start = std::chrono::steady_clock::now();
  REQUIRE(client.wait_for_close(3000));
  auto elapsed = std::chrono::steady_clock::now() - start;

  REQUIRE(elapsed >= 250ms);
  REQUIRE(client.received().empty());
  REQUIRE(wait_until([&] { return metric_get(fixture.server.metrics().read_timeouts) == 1; }));
}

TEST_CASE("Integration - idle connection closed after read deadline", "[integration]") {
  ServerFixture fixture;
  fixture.server.set_read_timeout_ms(200);
  fixture.start();

  RawTestClient client;
  REQUIRE(client.connect(fixture.port()));
  REQUIRE(client.wait_for_close(3000));
  REQUIRE(client.received().empty());
}

TEST_CASE("Integration - oversized header closes immediately", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  RawTestClient client;
  REQUIRE(client.connect(fixture.port()));
  // 2,000,000 bytes declared
  REQUIRE(client.send_raw({0x00, 0x1e, 0x84, 0x80}));

  REQUIRE(client.wait_for_close(1000));
  REQUIRE(client.received().empty());
  REQUIRE(wait_until([&] { return metric_get(fixture.server.metrics().frame_errors) == 1; }));
}

TEST_CASE("Integration - malformed payload closes the connection", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  RawTestClient client;
  REQUIRE(client.connect(fixture.port()));
  // Valid frame, unknown ProtocolMessage tag
  REQUIRE(client.send_raw({0, 0, 0, 4, 0, 0, 0, 9}));

  REQUIRE(client.wait_for_close(1000));
  REQUIRE(client.received().empty());
}

TEST_CASE("Integration - client disconnect mid-request", "[integration]") {
  std::atomic<int> started{0};
  ServerFixture fixture;
  fixture.server.set_digest([&](HashAlgorithm, const FilePath& path) {
    ++started;
    std::this_thread::sleep_for(100ms);
    return DigestResult::success(path.value());
  });
  fixture.start();

  {
    RawTestClient gone;
    REQUIRE(gone.connect(fixture.port()));
    REQUIRE(gone.send_message(make_request(HashingPacket(HashAlgorithm::kSha256, FilePath::local("a")))));
    REQUIRE(wait_until([&] { return started.load() == 1; }));
  }

  // Server keeps serving after the orphaned reply
  Client client = connect_client(fixture.port());
  auto response = client.request(HashingPacket(HashAlgorithm::kSha256, FilePath::local("b")));
  REQUIRE(response.has_value());
  REQUIRE(response.value().digest() == "b");
}

// ============================================================================
// Connection accounting
// ============================================================================

TEST_CASE("Integration - connections over the limit are rejected", "[integration]") {
  ServerFixture fixture;
  fixture.server.set_max_connections(2);
  fixture.start();

  Client a = connect_client(fixture.port());
  Client b = connect_client(fixture.port());
  REQUIRE(wait_until([&] { return metric_get(fixture.server.metrics().active_connections) == 2; }));

  RawTestClient extra;
  REQUIRE(extra.connect(fixture.port()));
  REQUIRE(extra.wait_for_close(1000));
  REQUIRE(metric_get(fixture.server.metrics().rejected_connections) == 1);
}

TEST_CASE("Integration - active connections tracked", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  {
    Client a = connect_client(fixture.port());
    Client b = connect_client(fixture.port());
    REQUIRE(wait_until([&] { return metric_get(fixture.server.metrics().active_connections) == 2; }));
  }
  REQUIRE(wait_until([&] { return metric_get(fixture.server.metrics().active_connections) == 0; }));
  REQUIRE(metric_get(fixture.server.metrics().total_connections) == 2);
}

TEST_CASE("Integration - listen address parsing", "[integration]") {
  std::string host;
  uint16_t port = 0;
  REQUIRE(parse_listen_address("127.0.0.1:8080", &host, &port));
  REQUIRE(host == "127.0.0.1");
  REQUIRE(port == 8080);

  REQUIRE(parse_listen_address(":9000", &host, &port));
  REQUIRE(host.empty());

  REQUIRE_FALSE(parse_listen_address("127.0.0.1", &host, &port));
  REQUIRE_FALSE(parse_listen_address("127.0.0.1:0", &host, &port));
  REQUIRE_FALSE(parse_listen_address("127.0.0.1:65536", &host, &port));
  REQUIRE_FALSE(parse_listen_address("127.0.0.1:80a", &host, &port));

  auto result = run("not-an-address", 1);
  REQUIRE_FALSE(result);
  REQUIRE(result.get_error() == ErrorCode::kInvalidAddress);
}
