#include "taskd/worker_pool.hpp"

#include <exception>
#include <string>

#include "taskd/log.hpp"

namespace taskd {

WorkerPool::WorkerPool(WorkQueue& queue, size_t num_workers, ServerMetrics& metrics, DigestFn digest_fn)
    : queue_(queue), metrics_(metrics), digest_fn_(std::move(digest_fn)) {
  if (num_workers == 0) num_workers = 1;
  threads_.reserve(num_workers);
  try {
    for (size_t i = 0; i < num_workers; ++i) {
      threads_.emplace_back(&WorkerPool::worker_loop, this, i);
    }
  } catch (const std::exception& e) {
    TASKD_LOG_ERROR(std::string("Failed to start worker: ") + e.what());
    queue_.close();
    join();
    throw;
  }
  TASKD_LOG_INFO("Worker pool started with " + std::to_string(num_workers) + " workers");
}

WorkerPool::~WorkerPool() {
  queue_.close();
  join();
}

void WorkerPool::join() {
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
}

TaskResponse WorkerPool::execute(const HashingPacket& packet) {
  if (packet.path().is_remote()) {
    metric_inc(metrics_.failed_tasks);
    TASKD_LOG_WARN("Remote file paths are not implemented");
    return TaskResponse::failed();
  }

  try {
    DigestResult result = digest_fn_(packet.algorithm(), packet.path());
    if (result) {
      return TaskResponse::success(std::move(result).value());
    }

    metric_inc(metrics_.failed_tasks);
    switch (result.get_error()) {
      case HashIoError::kNotImplemented:
        TASKD_LOG_WARN(std::string("Algorithm not implemented: ") + algorithm_name(packet.algorithm()));
        break;
      case HashIoError::kIo:
        TASKD_LOG_WARN("I/O error hashing " + packet.path().value());
        break;
    }
  } catch (const std::exception& e) {
    metric_inc(metrics_.failed_tasks);
    TASKD_LOG_ERROR(std::string("Digest threw: ") + e.what());
  }
  return TaskResponse::failed();
}

void WorkerPool::worker_loop(size_t index) {
  TASKD_LOG_DEBUG("Worker " + std::to_string(index) + " running");

  while (true) {
    optional<WorkItem> item = queue_.pop();
    if (!item) break;

    metric_inc(metrics_.processed_tasks);
    TaskResponse response = execute(item.value().packet);

    // The receiver may be gone if the client disconnected; that is fine.
    if (!item.value().responder.send(make_response(std::move(response)))) {
      TASKD_LOG_DEBUG("Worker " + std::to_string(index) + ": requester went away");
    }
  }

  TASKD_LOG_DEBUG("Worker " + std::to_string(index) + " exiting");
}

}  // namespace taskd
