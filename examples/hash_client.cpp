#include "taskd.hpp"

#include <cstring>
#include <iostream>
#include <string>

namespace {

int usage(const char* prog) {
  std::cerr << "Usage: " << prog << " <algorithm> <path> [host:port] [--remote]\n"
            << "  algorithms: sha224 sha256 sha384 sha512 sha512-224 sha512-256\n"
            << "              sha3-224 sha3-256 sha3-384 sha3-512 shake128 shake256 blake3" << std::endl;
  return 2;
}

}  // namespace

// Exit status: 0 Success, 1 Failed, 2 usage or connection error.
int main(int argc, char* argv[]) {
  if (argc < 3) return usage(argv[0]);

  auto algorithm = taskd::parse_algorithm(argv[1]);
  if (!algorithm) {
    std::cerr << "Unknown algorithm: " << argv[1] << std::endl;
    return usage(argv[0]);
  }

  std::string path = argv[2];
  std::string address = "127.0.0.1:8080";
  bool remote = false;
  for (int i = 3; i < argc; ++i) {
    if (std::strcmp(argv[i], "--remote") == 0) {
      remote = true;
    } else {
      address = argv[i];
    }
  }

  std::string host;
  uint16_t port = 0;
  if (!taskd::parse_listen_address(address, &host, &port) || host.empty()) {
    std::cerr << "Invalid server address: " << address << std::endl;
    return 2;
  }

  auto client = taskd::Client::connect(host, port);
  if (!client) {
    std::cerr << "Connect to " << address << " failed: " << taskd::error_code_name(client.get_error()) << std::endl;
    return 2;
  }

  taskd::FilePath file = remote ? taskd::FilePath::remote(path) : taskd::FilePath::local(path);
  auto response = client.value().request(taskd::HashingPacket(algorithm.value(), file));
  if (!response) {
    std::cerr << "Request failed: " << taskd::error_code_name(response.get_error()) << std::endl;
    return 2;
  }

  if (!response.value().ok()) {
    std::cout << "FAILED" << std::endl;
    return 1;
  }
  std::cout << response.value().digest() << "  " << path << std::endl;
  return 0;
}
