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
 * @file vocabulary.hpp
 * @brief Vocabulary types for taskd: ErrorCode, expected, optional, FixedVector.
 *
 * Derived from newosp vocabulary (iceoryx inspired).
 * expected/optional keep their payload in-place; FixedVector never touches
 * the heap.
 */

#ifndef TASKD_VOCABULARY_HPP_
#define TASKD_VOCABULARY_HPP_

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

// Exception support for -fno-exceptions builds
#if defined(__cpp_exceptions) || defined(__EXCEPTIONS)
#define TASKD_THROW(ex) throw(ex)
#else
#include <cstdio>
#include <cstdlib>
#define TASKD_THROW(ex)           \
  do {                            \
    std::fputs(#ex "\n", stderr); \
    std::abort();                 \
  } while (0)
#endif

// Assertion macro for programming errors (no-op in release)
#ifndef TASKD_ASSERT
#define TASKD_ASSERT(cond) ((void)(cond))
#endif

namespace taskd {

static constexpr size_t kCacheLine = 64;

// ============================================================================
// Error Types
// ============================================================================

enum class ErrorCode : uint8_t {
  kOk = 0,
  kFrameTooShort = 1,
  kFrameTooLarge = 2,
  kMalformed = 3,
  kTimeout = 4,
  kConnectionClosed = 5,
  kSocketError = 6,
  kQueueFull = 7,
  kQueueClosed = 8,
  kInvalidState = 9,
  kMaxConnectionsExceeded = 10,
  kInvalidAddress = 11,
  kInternalError = 255
};

inline const char* error_code_name(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk: return "ok";
    case ErrorCode::kFrameTooShort: return "frame too short";
    case ErrorCode::kFrameTooLarge: return "frame too large";
    case ErrorCode::kMalformed: return "malformed payload";
    case ErrorCode::kTimeout: return "timeout";
    case ErrorCode::kConnectionClosed: return "connection closed";
    case ErrorCode::kSocketError: return "socket error";
    case ErrorCode::kQueueFull: return "queue full";
    case ErrorCode::kQueueClosed: return "queue closed";
    case ErrorCode::kInvalidState: return "invalid state";
    case ErrorCode::kMaxConnectionsExceeded: return "max connections exceeded";
    case ErrorCode::kInvalidAddress: return "invalid address";
    case ErrorCode::kInternalError: return "internal error";
  }
  return "unknown";
}

// ============================================================================
// expected<V, E> - Lightweight error-or-value type
// ============================================================================

/**
 * @brief Holds either a success value of type V or an error of type E.
 *
 * Use static factory methods success() and error() to construct.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(val);
    return e;
  }

  static expected success(V&& val) noexcept {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(static_cast<V&&>(val));
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.has_value_ = false;
    e.err_ = err;
    return e;
  }

  expected(const expected& other) : storage_{}, err_(other.err_), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(other.value());
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      destroy();
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(other.value());
      }
    }
    return *this;
  }

  expected(expected&& other) noexcept : storage_{}, err_(other.err_), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(static_cast<V&&>(other.value()));
    }
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      destroy();
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(static_cast<V&&>(other.value()));
      }
    }
    return *this;
  }

  ~expected() { destroy(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    TASKD_ASSERT(has_value_);
    return *reinterpret_cast<V*>(&storage_);
  }

  const V& value() const& noexcept {
    TASKD_ASSERT(has_value_);
    return *reinterpret_cast<const V*>(&storage_);
  }

  // Moves the payload out; the expected is left holding a moved-from V.
  V&& value() && noexcept {
    TASKD_ASSERT(has_value_);
    return static_cast<V&&>(*reinterpret_cast<V*>(&storage_));
  }

  E get_error() const noexcept {
    TASKD_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& default_val) const { return has_value_ ? value() : default_val; }

 private:
  expected() noexcept : storage_{}, err_{}, has_value_(false) {}

  void destroy() noexcept {
    if (has_value_) {
      reinterpret_cast<V*>(&storage_)->~V();
      has_value_ = false;
    }
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_{};
  E err_{};
  bool has_value_{false};
};

/**
 * @brief Void specialization - represents success or error with no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept {
    expected e;
    e.has_value_ = true;
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.has_value_ = false;
    e.err_ = err;
    return e;
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    TASKD_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept : err_{}, has_value_(false) {}

  E err_{};
  bool has_value_{false};
};

// ============================================================================
// optional<T> - Lightweight nullable value
// ============================================================================

/**
 * @brief Holds either a value of type T or nothing. Works with move-only T
 *        as long as the copy operations are not used.
 */
template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& val) : has_value_(true) {  // NOLINT
    ::new (&storage_) T(val);
  }

  optional(T&& val) noexcept : has_value_(true) {  // NOLINT
    ::new (&storage_) T(static_cast<T&&>(val));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) T(other.value());
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_) T(other.value());
      }
    }
    return *this;
  }

  optional(optional&& other) noexcept : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) T(static_cast<T&&>(other.value()));
    }
  }

  optional& operator=(optional&& other) noexcept {
    if (this != &other) {
      reset();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_) T(static_cast<T&&>(other.value()));
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  template <typename... Args>
  T& emplace(Args&&... args) {
    reset();
    ::new (&storage_) T(static_cast<Args&&>(args)...);
    has_value_ = true;
    return value();
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    TASKD_ASSERT(has_value_);
    return *reinterpret_cast<T*>(&storage_);
  }

  const T& value() const noexcept {
    TASKD_ASSERT(has_value_);
    return *reinterpret_cast<const T*>(&storage_);
  }

  T value_or(const T& default_val) const { return has_value_ ? value() : default_val; }

  void reset() noexcept {
    if (has_value_) {
      reinterpret_cast<T*>(&storage_)->~T();
      has_value_ = false;
    }
  }

 private:
  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_;
  bool has_value_;
};

// ============================================================================
// FixedVector<T, Capacity> - Stack-allocated fixed-capacity vector
// ============================================================================

/**
 * @brief Fixed-capacity vector with inline storage and no heap allocation.
 *
 * @tparam T Element type
 * @tparam Capacity Maximum number of elements
 */
template <typename T, uint32_t Capacity>
class FixedVector final {
  static_assert(Capacity > 0U, "FixedVector capacity must be > 0");

 public:
  using value_type = T;
  using iterator = T*;
  using const_iterator = const T*;

  FixedVector() noexcept {}  // NOLINT

  ~FixedVector() noexcept { clear(); }

  FixedVector(const FixedVector&) = delete;
  FixedVector& operator=(const FixedVector&) = delete;

  T& operator[](uint32_t index) noexcept { return *reinterpret_cast<T*>(storage_ + index * sizeof(T)); }

  const T& operator[](uint32_t index) const noexcept {
    return *reinterpret_cast<const T*>(storage_ + index * sizeof(T));
  }

  T& back() noexcept { return (*this)[size_ - 1U]; }

  T* data() noexcept { return reinterpret_cast<T*>(storage_); }
  const T* data() const noexcept { return reinterpret_cast<const T*>(storage_); }

  iterator begin() noexcept { return data(); }
  const_iterator begin() const noexcept { return data(); }
  iterator end() noexcept { return data() + size_; }
  const_iterator end() const noexcept { return data() + size_; }

  [[nodiscard]] bool empty() const noexcept { return size_ == 0U; }
  [[nodiscard]] uint32_t size() const noexcept { return size_; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }
  [[nodiscard]] bool full() const noexcept { return size_ >= Capacity; }

  bool push_back(T&& value) noexcept { return emplace_back(static_cast<T&&>(value)); }

  template <typename... CtorArgs>
  bool emplace_back(CtorArgs&&... args) noexcept {
    if (size_ >= Capacity) {
      return false;
    }
    ::new (storage_ + size_ * sizeof(T)) T{static_cast<CtorArgs&&>(args)...};
    ++size_;
    return true;
  }

  bool pop_back() noexcept {
    if (size_ == 0U) {
      return false;
    }
    --size_;
    (*this)[size_].~T();
    return true;
  }

  // Swap-and-pop removal; does not preserve order.
  void erase_unordered(uint32_t index) noexcept {
    if (index >= size_) {
      return;
    }
    if (index < size_ - 1U) {
      (*this)[index] = static_cast<T&&>((*this)[size_ - 1U]);
    }
    pop_back();
  }

  void clear() noexcept {
    while (size_ > 0U) {
      --size_;
      (*this)[size_].~T();
    }
  }

 private:
  alignas(T) uint8_t storage_[sizeof(T) * Capacity];
  uint32_t size_{0U};
};

}  // namespace taskd

#endif  // TASKD_VOCABULARY_HPP_
