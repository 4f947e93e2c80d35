#include "nmusig/crypto/hash.hpp"

#include <stdexcept>
#include <utility>

#include <openssl/evp.h>

namespace nmusig {
namespace {

EVP_MD_CTX* NewCtx() {
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (ctx == nullptr) {
    throw std::runtime_error("failed to allocate EVP_MD_CTX");
  }
  return ctx;
}

}  // namespace

void Sha256Hasher::CtxDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
  EVP_MD_CTX_free(ctx);
}

Sha256Hasher::Sha256Hasher() : ctx_(NewCtx()) {
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("SHA256 init failed");
  }
}

Sha256Hasher::Sha256Hasher(const Sha256Hasher& other) : ctx_(NewCtx()) {
  if (EVP_MD_CTX_copy_ex(ctx_.get(), other.ctx_.get()) != 1) {
    throw std::runtime_error("SHA256 state copy failed");
  }
}

Sha256Hasher& Sha256Hasher::operator=(const Sha256Hasher& other) {
  if (this != &other) {
    Sha256Hasher copy(other);
    ctx_ = std::move(copy.ctx_);
  }
  return *this;
}

void Sha256Hasher::Update(std::span<const uint8_t> data) {
  if (data.empty()) {
    return;
  }
  if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("SHA256 update failed");
  }
}

Bytes Sha256Hasher::Digest() const {
  Sha256Hasher snapshot(*this);
  Bytes out(EVP_MAX_MD_SIZE);
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(snapshot.ctx_.get(), out.data(), &len) != 1) {
    throw std::runtime_error("SHA256 final failed");
  }
  out.resize(len);
  return out;
}

Bytes Sha256(std::span<const uint8_t> data) {
  Sha256Hasher hasher;
  hasher.Update(data);
  return hasher.Digest();
}

}  // namespace nmusig
