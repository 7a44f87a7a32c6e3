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
 * @file oneshot.hpp
 * @brief Single-use reply channel between a worker and a connection.
 *
 * The sender is fulfilled at most once. If the receiver is gone the send is
 * silently void; if the sender is destroyed unfulfilled the receiver observes
 * kSenderDropped. An optional notify hook runs on the sender's thread when the
 * channel resolves, which is how a worker wakes the reactor.
 */

#ifndef TASKD_ONESHOT_HPP_
#define TASKD_ONESHOT_HPP_

#include "vocabulary.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

namespace taskd {

enum class OneShotStatus : uint8_t { kPending, kReady, kSenderDropped };

namespace detail {

template <typename T>
struct OneShotState {
  std::mutex mtx;
  std::condition_variable cv;
  optional<T> value;
  bool sender_alive = true;
  bool receiver_alive = true;
  bool taken = false;
  std::function<void()> notify;
};

}  // namespace detail

template <typename T>
class OneShotSender {
 public:
  OneShotSender() = default;
  explicit OneShotSender(std::shared_ptr<detail::OneShotState<T>> state) : state_(std::move(state)) {}

  OneShotSender(OneShotSender&&) noexcept = default;
  OneShotSender& operator=(OneShotSender&& other) noexcept {
    if (this != &other) {
      drop();
      state_ = std::move(other.state_);
    }
    return *this;
  }
  OneShotSender(const OneShotSender&) = delete;
  OneShotSender& operator=(const OneShotSender&) = delete;

  ~OneShotSender() { drop(); }

  // Fulfil the channel. Returns false if the receiver no longer exists.
  // The sender is spent afterwards either way.
  bool send(T value) {
    TASKD_ASSERT(state_);
    if (!state_) return false;

    auto state = std::move(state_);
    std::function<void()> notify;
    bool delivered = false;
    {
      std::lock_guard<std::mutex> lock(state->mtx);
      state->sender_alive = false;
      if (state->receiver_alive) {
        state->value.emplace(std::move(value));
        delivered = true;
        notify = state->notify;
      }
    }
    if (delivered) {
      state->cv.notify_all();
      if (notify) notify();
    }
    return delivered;
  }

  bool valid() const { return state_ != nullptr; }

 private:
  void drop() {
    if (!state_) return;
    auto state = std::move(state_);
    std::function<void()> notify;
    {
      std::lock_guard<std::mutex> lock(state->mtx);
      state->sender_alive = false;
      if (state->receiver_alive) notify = state->notify;
    }
    state->cv.notify_all();
    if (notify) notify();
  }

  std::shared_ptr<detail::OneShotState<T>> state_;
};

template <typename T>
class OneShotReceiver {
 public:
  OneShotReceiver() = default;
  explicit OneShotReceiver(std::shared_ptr<detail::OneShotState<T>> state) : state_(std::move(state)) {}

  OneShotReceiver(OneShotReceiver&&) noexcept = default;
  OneShotReceiver& operator=(OneShotReceiver&& other) noexcept {
    if (this != &other) {
      close();
      state_ = std::move(other.state_);
    }
    return *this;
  }
  OneShotReceiver(const OneShotReceiver&) = delete;
  OneShotReceiver& operator=(const OneShotReceiver&) = delete;

  ~OneShotReceiver() { close(); }

  // Non-blocking. On kReady the value is moved into *out.
  OneShotStatus try_receive(optional<T>* out) {
    TASKD_ASSERT(state_);
    if (!state_) return OneShotStatus::kSenderDropped;
    std::lock_guard<std::mutex> lock(state_->mtx);
    return take_locked(out);
  }

  // Block until the channel resolves or timeout elapses (kPending on timeout).
  OneShotStatus wait(optional<T>* out, std::chrono::milliseconds timeout) {
    TASKD_ASSERT(state_);
    if (!state_) return OneShotStatus::kSenderDropped;
    std::unique_lock<std::mutex> lock(state_->mtx);
    state_->cv.wait_for(lock, timeout, [this] { return state_->value.has_value() || !state_->sender_alive; });
    return take_locked(out);
  }

  bool valid() const { return state_ != nullptr; }

  // Release the channel; a later send() on the other side returns false.
  void close() {
    if (!state_) return;
    {
      std::lock_guard<std::mutex> lock(state_->mtx);
      state_->receiver_alive = false;
      state_->value.reset();
      state_->notify = nullptr;
    }
    state_.reset();
  }

 private:
  OneShotStatus take_locked(optional<T>* out) {
    if (state_->value.has_value()) {
      TASKD_ASSERT(!state_->taken);
      state_->taken = true;
      out->emplace(std::move(state_->value.value()));
      state_->value.reset();
      return OneShotStatus::kReady;
    }
    if (state_->taken || !state_->sender_alive) {
      return OneShotStatus::kSenderDropped;
    }
    return OneShotStatus::kPending;
  }

  std::shared_ptr<detail::OneShotState<T>> state_;
};

// Create a connected sender/receiver pair. notify (optional) runs on the
// sender's thread once the channel resolves while the receiver is alive.
template <typename T>
std::pair<OneShotSender<T>, OneShotReceiver<T>> make_oneshot(std::function<void()> notify = nullptr) {
  auto state = std::make_shared<detail::OneShotState<T>>();
  state->notify = std::move(notify);
  return {OneShotSender<T>(state), OneShotReceiver<T>(state)};
}

}  // namespace taskd

#endif  // TASKD_ONESHOT_HPP_
