#include "taskd/digest.hpp"

#include <cerrno>
#include <cstring>

#include <array>
#include <memory>

#include <blake3.h>
#include <fcntl.h>
#include <mbedtls/md.h>
#include <openssl/evp.h>
#include <unistd.h>

#include "taskd/log.hpp"
#include "taskd/utils.hpp"

namespace taskd {

namespace {

static constexpr size_t kShake128OutputLen = 32;
static constexpr size_t kShake256OutputLen = 64;

// Incremental hash over one of the linked crypto backends.
class Hasher {
 public:
  virtual ~Hasher() = default;
  virtual bool update(const uint8_t* data, size_t len) = 0;
  virtual bool finish(std::string* hex) = 0;
};

// mbedTLS message digests: SHA-2 and SHA3.
class MdHasher : public Hasher {
 public:
  explicit MdHasher(const mbedtls_md_info_t* info) : info_(info) {
    mbedtls_md_init(&ctx_);
    ok_ = mbedtls_md_setup(&ctx_, info, 0) == 0 && mbedtls_md_starts(&ctx_) == 0;
  }
  ~MdHasher() override { mbedtls_md_free(&ctx_); }

  MdHasher(const MdHasher&) = delete;
  MdHasher& operator=(const MdHasher&) = delete;

  bool update(const uint8_t* data, size_t len) override {
    return ok_ && mbedtls_md_update(&ctx_, data, len) == 0;
  }

  bool finish(std::string* hex) override {
    std::array<unsigned char, MBEDTLS_MD_MAX_SIZE> out{};
    if (!ok_ || mbedtls_md_finish(&ctx_, out.data()) != 0) return false;
    *hex = Hex::encode(out.data(), mbedtls_md_get_size(info_));
    return true;
  }

 private:
  mbedtls_md_context_t ctx_;
  const mbedtls_md_info_t* info_;
  bool ok_ = false;
};

// OpenSSL EVP: truncated SHA-512 and the SHAKE XOFs. xof_len == 0 means a
// fixed-size digest.
class EvpHasher : public Hasher {
 public:
  EvpHasher(const EVP_MD* md, size_t xof_len) : ctx_(EVP_MD_CTX_new()), xof_len_(xof_len) {
    ok_ = ctx_ != nullptr && md != nullptr && EVP_DigestInit_ex(ctx_, md, nullptr) == 1;
  }
  ~EvpHasher() override { EVP_MD_CTX_free(ctx_); }

  EvpHasher(const EvpHasher&) = delete;
  EvpHasher& operator=(const EvpHasher&) = delete;

  bool update(const uint8_t* data, size_t len) override {
    return ok_ && EVP_DigestUpdate(ctx_, data, len) == 1;
  }

  bool finish(std::string* hex) override {
    if (!ok_) return false;
    std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
    if (xof_len_ > 0) {
      if (EVP_DigestFinalXOF(ctx_, out.data(), xof_len_) != 1) return false;
      *hex = Hex::encode(out.data(), xof_len_);
      return true;
    }
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1) return false;
    *hex = Hex::encode(out.data(), len);
    return true;
  }

 private:
  EVP_MD_CTX* ctx_;
  size_t xof_len_;
  bool ok_ = false;
};

class Blake3Hasher : public Hasher {
 public:
  Blake3Hasher() { blake3_hasher_init(&hasher_); }

  bool update(const uint8_t* data, size_t len) override {
    blake3_hasher_update(&hasher_, data, len);
    return true;
  }

  bool finish(std::string* hex) override {
    std::array<uint8_t, BLAKE3_OUT_LEN> out{};
    blake3_hasher_finalize(&hasher_, out.data(), out.size());
    *hex = Hex::encode(out.data(), out.size());
    return true;
  }

 private:
  blake3_hasher hasher_;
};

std::unique_ptr<Hasher> make_md(mbedtls_md_type_t type) {
  const mbedtls_md_info_t* info = mbedtls_md_info_from_type(type);
  if (info == nullptr) return nullptr;
  return std::make_unique<MdHasher>(info);
}

// nullptr when no backend provides algorithm.
std::unique_ptr<Hasher> make_hasher(HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::kSha224: return make_md(MBEDTLS_MD_SHA224);
    case HashAlgorithm::kSha256: return make_md(MBEDTLS_MD_SHA256);
    case HashAlgorithm::kSha384: return make_md(MBEDTLS_MD_SHA384);
    case HashAlgorithm::kSha512: return make_md(MBEDTLS_MD_SHA512);
    case HashAlgorithm::kSha3_224: return make_md(MBEDTLS_MD_SHA3_224);
    case HashAlgorithm::kSha3_256: return make_md(MBEDTLS_MD_SHA3_256);
    case HashAlgorithm::kSha3_384: return make_md(MBEDTLS_MD_SHA3_384);
    case HashAlgorithm::kSha3_512: return make_md(MBEDTLS_MD_SHA3_512);
    case HashAlgorithm::kSha512_224: return std::make_unique<EvpHasher>(EVP_sha512_224(), 0);
    case HashAlgorithm::kSha512_256: return std::make_unique<EvpHasher>(EVP_sha512_256(), 0);
    case HashAlgorithm::kShake128: return std::make_unique<EvpHasher>(EVP_shake128(), kShake128OutputLen);
    case HashAlgorithm::kShake256: return std::make_unique<EvpHasher>(EVP_shake256(), kShake256OutputLen);
    case HashAlgorithm::kBlake3: return std::make_unique<Blake3Hasher>();
    case HashAlgorithm::kUnimplemented: return nullptr;
  }
  return nullptr;
}

class FileDescriptor {
 public:
  explicit FileDescriptor(int fd) : fd_(fd) {}
  ~FileDescriptor() {
    if (fd_ >= 0) ::close(fd_);
  }

  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

 private:
  int fd_;
};

}  // namespace

bool digest_supported(HashAlgorithm algorithm) { return make_hasher(algorithm) != nullptr; }

DigestResult digest_bytes(HashAlgorithm algorithm, const uint8_t* data, size_t len) {
  auto hasher = make_hasher(algorithm);
  if (!hasher) {
    return DigestResult::error(HashIoError::kNotImplemented);
  }

  std::string hex;
  if (!hasher->update(data, len) || !hasher->finish(&hex)) {
    return DigestResult::error(HashIoError::kIo);
  }
  return DigestResult::success(std::move(hex));
}

DigestResult digest(HashAlgorithm algorithm, const FilePath& path) {
  if (path.is_remote()) {
    return DigestResult::error(HashIoError::kNotImplemented);
  }

  auto hasher = make_hasher(algorithm);
  if (!hasher) {
    return DigestResult::error(HashIoError::kNotImplemented);
  }

  FileDescriptor file(::open(path.value().c_str(), O_RDONLY | O_CLOEXEC));
  if (!file.valid()) {
    TASKD_LOG_DEBUG("open " + path.value() + ": " + std::strerror(errno));
    return DigestResult::error(HashIoError::kIo);
  }

  std::array<uint8_t, kDigestReadChunk> buffer;
  while (true) {
    ssize_t n = ::read(file.get(), buffer.data(), buffer.size());
    if (n > 0) {
      if (!hasher->update(buffer.data(), static_cast<size_t>(n))) {
        return DigestResult::error(HashIoError::kIo);
      }
    } else if (n == 0) {
      break;
    } else {
      int err = errno;
      if (err == EINTR) continue;
      TASKD_LOG_DEBUG("read " + path.value() + ": " + std::strerror(err));
      return DigestResult::error(HashIoError::kIo);
    }
  }

  std::string hex;
  if (!hasher->finish(&hex)) {
    return DigestResult::error(HashIoError::kIo);
  }
  return DigestResult::success(std::move(hex));
}

}  // namespace taskd
