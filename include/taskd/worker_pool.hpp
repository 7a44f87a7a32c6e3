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
 * @file worker_pool.hpp
 * @brief Fixed set of worker threads draining the dispatch queue.
 *
 * Each worker claims a WorkItem, runs the digest on its own thread and
 * fulfils the item's responder exactly once with a TaskResponse.
 */

#ifndef TASKD_WORKER_POOL_HPP_
#define TASKD_WORKER_POOL_HPP_

#include "digest.hpp"
#include "dispatch_queue.hpp"
#include "message.hpp"
#include "metrics.hpp"
#include "oneshot.hpp"

#include <thread>
#include <vector>

namespace taskd {

static constexpr size_t kDefaultNumWorkers = 10;

struct WorkItem {
  HashingPacket packet;
  OneShotSender<ProtocolMessage> responder;
};

using WorkQueue = BoundedQueue<WorkItem>;

class WorkerPool {
 public:
  // Starts num_workers threads immediately. Throws std::system_error if a
  // thread cannot be created (already started workers are stopped first).
  WorkerPool(WorkQueue& queue, size_t num_workers, ServerMetrics& metrics, DigestFn digest_fn = &digest);

  // Closes the queue and joins.
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Wait for every worker to exit. Workers exit once the queue is closed and
  // drained, so close the queue first.
  void join();

  size_t size() const { return threads_.size(); }

  // Run one packet through the digest and map the outcome to a response.
  // Never throws.
  TaskResponse execute(const HashingPacket& packet);

 private:
  void worker_loop(size_t index);

  WorkQueue& queue_;
  ServerMetrics& metrics_;
  DigestFn digest_fn_;
  std::vector<std::thread> threads_;
};

}  // namespace taskd

#endif  // TASKD_WORKER_POOL_HPP_
