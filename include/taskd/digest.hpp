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
 * @file digest.hpp
 * @brief File digests over the linked crypto libraries.
 *
 * SHA-2 and SHA3 go through mbedTLS, SHA-512/224, SHA-512/256 and SHAKE
 * through OpenSSL EVP, BLAKE3 through libblake3. SHAKE128 emits 32 bytes and
 * SHAKE256 64 bytes. Files are streamed through an 8 KiB buffer; output is
 * lowercase hex. Unimplemented and remote paths report
 * HashIoError::kNotImplemented.
 */

#ifndef TASKD_DIGEST_HPP_
#define TASKD_DIGEST_HPP_

#include "message.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <functional>
#include <string>

namespace taskd {

enum class HashIoError : uint8_t {
  kNotImplemented = 1,  // remote path or algorithm not provided
  kIo = 2,              // open/read failure
};

inline const char* hash_io_error_name(HashIoError err) noexcept {
  switch (err) {
    case HashIoError::kNotImplemented: return "not implemented";
    case HashIoError::kIo: return "io error";
  }
  return "unknown";
}

using DigestResult = expected<std::string, HashIoError>;

// Signature of the digest capability consumed by the worker pool.
using DigestFn = std::function<DigestResult(HashAlgorithm, const FilePath&)>;

static constexpr size_t kDigestReadChunk = 8192;

// Hash the full contents of path with algorithm.
DigestResult digest(HashAlgorithm algorithm, const FilePath& path);

// Hash an in-memory buffer (used by tests and for known-answer checks).
DigestResult digest_bytes(HashAlgorithm algorithm, const uint8_t* data, size_t len);

// True if a linked crypto library provides algorithm.
bool digest_supported(HashAlgorithm algorithm);

}  // namespace taskd

#endif  // TASKD_DIGEST_HPP_
