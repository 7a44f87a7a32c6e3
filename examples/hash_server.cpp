#include "taskd.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

taskd::Server* g_server = nullptr;

void handle_signal(int) {
  if (g_server != nullptr) g_server->stop();
}

}  // namespace

// Usage: hash_server [listen_address] [num_workers] [queue_capacity]
int main(int argc, char* argv[]) {
  std::string listen_address = "127.0.0.1:8080";
  size_t num_workers = taskd::kDefaultNumWorkers;
  size_t queue_capacity = taskd::kDefaultQueueCapacity;

  taskd::Logger::set_level(taskd::Logger::parse_level(std::getenv("TASKD_LOG_LEVEL")));

  try {
    if (argc > 1) listen_address = argv[1];
    if (argc > 2) num_workers = static_cast<size_t>(std::stoul(argv[2]));
    if (argc > 3) queue_capacity = static_cast<size_t>(std::stoul(argv[3]));
  } catch (const std::exception&) {
    std::cerr << "Usage: " << argv[0] << " [listen_address] [num_workers] [queue_capacity]" << std::endl;
    return 2;
  }

  std::string host;
  uint16_t port = 0;
  if (!taskd::parse_listen_address(listen_address, &host, &port)) {
    std::cerr << "Invalid listen address: " << listen_address << std::endl;
    return 2;
  }

  try {
    taskd::Server server(port, host);
    server.set_num_workers(num_workers).set_queue_capacity(queue_capacity);

    g_server = &server;
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    auto result = server.run();
    g_server = nullptr;

    const auto& m = server.metrics();
    std::cout << "processed_tasks=" << taskd::metric_get(m.processed_tasks)
              << " failed_tasks=" << taskd::metric_get(m.failed_tasks)
              << " total_connections=" << taskd::metric_get(m.total_connections) << std::endl;

    if (!result) {
      std::cerr << "Error: " << taskd::error_code_name(result.get_error()) << std::endl;
      return 1;
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
