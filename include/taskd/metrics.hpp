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
 * @file metrics.hpp
 * @brief Server-wide counters shared by the reactor and the worker pool.
 *
 * Relaxed atomics; no cross-field invariant. Owned by the Server and passed by
 * reference to every connection and to the WorkerPool.
 */

#ifndef TASKD_METRICS_HPP_
#define TASKD_METRICS_HPP_

#include "vocabulary.hpp"

#include <atomic>
#include <cstdint>

namespace taskd {

struct alignas(kCacheLine) ServerMetrics {
  // Task counters
  std::atomic<uint64_t> processed_tasks{0};
  std::atomic<uint64_t> failed_tasks{0};

  // Connection counters
  std::atomic<uint64_t> active_connections{0};
  std::atomic<uint64_t> total_connections{0};
  std::atomic<uint64_t> rejected_connections{0};

  // Error counters
  std::atomic<uint64_t> frame_errors{0};
  std::atomic<uint64_t> read_timeouts{0};
  std::atomic<uint64_t> socket_errors{0};

  void reset() {
    processed_tasks = 0;
    failed_tasks = 0;
    active_connections = 0;
    total_connections = 0;
    rejected_connections = 0;
    frame_errors = 0;
    read_timeouts = 0;
    socket_errors = 0;
  }
};

inline void metric_inc(std::atomic<uint64_t>& counter) { counter.fetch_add(1, std::memory_order_relaxed); }

inline void metric_dec(std::atomic<uint64_t>& counter) { counter.fetch_sub(1, std::memory_order_relaxed); }

inline uint64_t metric_get(const std::atomic<uint64_t>& counter) { return counter.load(std::memory_order_relaxed); }

}  // namespace taskd

#endif  // TASKD_METRICS_HPP_
