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


#ifndef TASKD_UTILS_HPP_
#define TASKD_UTILS_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <array>
#include <string>
#include <string_view>

#include <sys/uio.h>

namespace taskd {

// ============================================================================
// Hex encoding (lowercase, used for digest output)
// ============================================================================

class Hex {
 public:
  static std::string encode(const uint8_t* data, size_t size) {
    static constexpr const char kDigits[] = "0123456789abcdef";
    std::string result;
    result.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
      result.push_back(kDigits[data[i] >> 4]);
      result.push_back(kDigits[data[i] & 0x0f]);
    }
    return result;
  }

  static bool is_lower_hex(std::string_view text) {
    for (char c : text) {
      if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
  }
};

// ============================================================================
// Big-endian integer helpers (wire byte order)
// ============================================================================

namespace be {

inline void store_u32(uint8_t* out, uint32_t v) {
  out[0] = static_cast<uint8_t>((v >> 24) & 0xFF);
  out[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
  out[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
  out[3] = static_cast<uint8_t>(v & 0xFF);
}

inline uint32_t load_u32(const uint8_t* in) {
  return (static_cast<uint32_t>(in[0]) << 24) | (static_cast<uint32_t>(in[1]) << 16) |
         (static_cast<uint32_t>(in[2]) << 8) | static_cast<uint32_t>(in[3]);
}

inline void store_u64(uint8_t* out, uint64_t v) {
  for (int i = 0; i < 8; ++i) {
    out[i] = static_cast<uint8_t>((v >> (8 * (7 - i))) & 0xFF);
  }
}

inline uint64_t load_u64(const uint8_t* in) {
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i) {
    v = (v << 8) | in[i];
  }
  return v;
}

}  // namespace be

// ============================================================================
// UTF-8 validation (strict: rejects overlongs, surrogates, > U+10FFFF)
// ============================================================================

inline bool is_valid_utf8(const uint8_t* data, size_t size) {
  size_t i = 0;
  while (i < size) {
    uint8_t c = data[i];
    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t extra = 0;
    uint32_t cp = 0;
    uint32_t min_cp = 0;
    if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp = c & 0x1F;
      min_cp = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp = c & 0x0F;
      min_cp = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp = c & 0x07;
      min_cp = 0x10000;
    } else {
      return false;
    }

    if (size - i <= extra) return false;
    for (size_t k = 1; k <= extra; ++k) {
      uint8_t cc = data[i + k];
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
    i += extra + 1;
  }
  return true;
}

// ============================================================================
// RingBuffer - Fixed-size circular buffer with zero-copy readv
// ============================================================================

template <typename T, size_t Size>
class alignas(kCacheLine) RingBuffer {
 public:
  static constexpr size_t kCapacity = Size;
  RingBuffer() = default;

  bool push(const T* data, size_t len) {
    if (available() < len) return false;
    for (size_t i = 0; i < len; ++i) {
      buffer_[write_idx_] = data[i];
      write_idx_ = (write_idx_ + 1) % kCapacity;
    }
    count_ += len;
    return true;
  }

  void advance(size_t len) {
    if (len > count_) len = count_;
    read_idx_ = (read_idx_ + len) % kCapacity;
    count_ -= len;
  }

  size_t size() const { return count_; }
  size_t available() const { return kCapacity - count_; }
  bool empty() const { return count_ == 0; }

  void clear() {
    read_idx_ = 0;
    write_idx_ = 0;
    count_ = 0;
  }

  // Fill iovec for readv (receive straight into the free region)
  size_t fill_iovec_write(struct iovec* iov, size_t max_iov) const {
    size_t avail = available();
    if (avail == 0 || max_iov == 0) return 0;
    size_t contiguous = kCapacity - write_idx_;
    if (contiguous >= avail) {
      iov[0].iov_base = const_cast<T*>(buffer_.data() + write_idx_);
      iov[0].iov_len = avail;
      return 1;
    }
    if (max_iov < 2) {
      iov[0].iov_base = const_cast<T*>(buffer_.data() + write_idx_);
      iov[0].iov_len = contiguous;
      return 1;
    }
    iov[0].iov_base = const_cast<T*>(buffer_.data() + write_idx_);
    iov[0].iov_len = contiguous;
    iov[1].iov_base = const_cast<T*>(buffer_.data());
    iov[1].iov_len = avail - contiguous;
    return 2;
  }

  void commit_write(size_t len) {
    if (len > available()) len = available();
    write_idx_ = (write_idx_ + len) % kCapacity;
    count_ += len;
  }

  // Longest contiguous readable run starting at the read index.
  const T* read_ptr(size_t* out_len) const {
    if (empty()) {
      *out_len = 0;
      return nullptr;
    }
    size_t contiguous = kCapacity - read_idx_;
    *out_len = (contiguous >= count_) ? count_ : contiguous;
    return buffer_.data() + read_idx_;
  }

 private:
  alignas(kCacheLine) std::array<T, kCapacity> buffer_{};
  size_t read_idx_ = 0;
  size_t write_idx_ = 0;
  size_t count_ = 0;
};

}  // namespace taskd

#endif  // TASKD_UTILS_HPP_
