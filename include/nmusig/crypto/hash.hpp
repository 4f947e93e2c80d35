#pragma once

#include <memory>
#include <span>

#include "nmusig/common/bytes.hpp"

struct evp_md_ctx_st;

namespace nmusig {

// Incremental SHA-256. Digest() leaves the running state untouched, so a
// hasher can be finalized, extended, and finalized again.
class Sha256Hasher {
 public:
  Sha256Hasher();
  Sha256Hasher(const Sha256Hasher& other);
  Sha256Hasher& operator=(const Sha256Hasher& other);
  Sha256Hasher(Sha256Hasher&&) noexcept = default;
  Sha256Hasher& operator=(Sha256Hasher&&) noexcept = default;
  ~Sha256Hasher() = default;

  void Update(std::span<const uint8_t> data);
  Bytes Digest() const;

 private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st* ctx) const noexcept;
  };

  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

Bytes Sha256(std::span<const uint8_t> data);

}  // namespace nmusig
