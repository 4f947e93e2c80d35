#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <gmpxx.h>

namespace nmusig {

// Element of Z_q, q the secp256k1 group order. Always stored reduced.
class Scalar {
 public:
  // Zero.
  Scalar();
  explicit Scalar(const mpz_class& value);

  static Scalar One();
  static Scalar FromUint64(uint64_t value);
  // Reduces an arbitrary-length big-endian integer; used for hash outputs.
  static Scalar FromBigEndianModQ(std::span<const uint8_t> bytes);

  std::array<uint8_t, 32> ToCanonicalBytes() const;

  const mpz_class& value() const;
  bool IsZero() const;

  // [1, x, x^2, ..., x^(count-1)]
  std::vector<Scalar> Powers(size_t count) const;

  Scalar operator+(const Scalar& other) const;
  Scalar operator*(const Scalar& other) const;
  Scalar& operator+=(const Scalar& other);
  Scalar& operator*=(const Scalar& other);

  bool operator==(const Scalar& other) const;
  bool operator!=(const Scalar& other) const;

  static const mpz_class& ModulusQ();

 private:
  mpz_class value_;
};

}  // namespace nmusig
