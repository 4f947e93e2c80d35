#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "nmusig/common/bytes.hpp"
#include "nmusig/crypto/ec_point.hpp"
#include "nmusig/crypto/hash.hpp"
#include "nmusig/crypto/scalar.hpp"

namespace nmusig {

// Length-prefixed label/value encoding streamed into SHA-256. Every field is
// framed as u32be(len(label)) || label || u32be(len(data)) || data, so two
// transcripts collide only if they carry the same fields in the same order.
// Fields can be appended after a challenge is drawn.
class Transcript {
 public:
  explicit Transcript(std::string_view domain);

  void append(std::string_view label, std::span<const uint8_t> data);
  void append_point(std::string_view label, const ECPoint& point);
  void append_u32_be(std::string_view label, uint32_t value);

  Scalar challenge_scalar_mod_q() const;

 private:
  Sha256Hasher hasher_;
};

}  // namespace nmusig
