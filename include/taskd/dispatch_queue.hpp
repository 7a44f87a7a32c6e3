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
 * @file dispatch_queue.hpp
 * @brief Bounded FIFO channel from connection handlers to the worker pool.
 *
 * The reactor submits with try_push() and keeps the item when the queue is
 * full; workers claim items with pop(), which is mutually exclusive so each
 * item goes to exactly one worker.
 */

#ifndef TASKD_DISPATCH_QUEUE_HPP_
#define TASKD_DISPATCH_QUEUE_HPP_

#include "vocabulary.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <utility>

namespace taskd {

static constexpr size_t kDefaultQueueCapacity = 100;

template <typename T>
class BoundedQueue {
 public:
  explicit BoundedQueue(size_t capacity = kDefaultQueueCapacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // Non-blocking. On failure the item is left untouched in the caller's hands.
  expected<void, ErrorCode> try_push(T& item) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (closed_) return expected<void, ErrorCode>::error(ErrorCode::kQueueClosed);
      if (items_.size() >= capacity_) return expected<void, ErrorCode>::error(ErrorCode::kQueueFull);
      items_.push_back(std::move(item));
    }
    not_empty_.notify_one();
    return expected<void, ErrorCode>::success();
  }

  // Blocks while full. Fails only once the queue is closed.
  expected<void, ErrorCode> push(T item) {
    {
      std::unique_lock<std::mutex> lock(mtx_);
      not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
      if (closed_) return expected<void, ErrorCode>::error(ErrorCode::kQueueClosed);
      items_.push_back(std::move(item));
    }
    not_empty_.notify_one();
    return expected<void, ErrorCode>::success();
  }

  // Blocks until an item is available. Empty result once closed and drained.
  optional<T> pop() {
    optional<T> out;
    std::function<void()> hook;
    {
      std::unique_lock<std::mutex> lock(mtx_);
      not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
      if (items_.empty()) return out;
      out.emplace(std::move(items_.front()));
      items_.pop_front();
      hook = on_pop_;
    }
    not_full_.notify_one();
    if (hook) hook();
    return out;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  // Invoked on the consumer's thread after each successful pop.
  void set_on_pop(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(mtx_);
    on_pop_ = std::move(hook);
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return closed_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return items_.size();
  }

  size_t capacity() const { return capacity_; }

 private:
  const size_t capacity_;
  mutable std::mutex mtx_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> items_;
  bool closed_ = false;
  std::function<void()> on_pop_;
};

}  // namespace taskd

#endif  // TASKD_DISPATCH_QUEUE_HPP_
