#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include "nmusig/common/bytes.hpp"
#include "nmusig/crypto/scalar.hpp"

namespace nmusig {

// A non-infinity secp256k1 point held in 33-byte compressed form. Operations
// whose result would be the point at infinity throw std::invalid_argument.
class ECPoint {
 public:
  static constexpr size_t kCompressedLen = 33;

  ECPoint();

  static ECPoint GeneratorMultiply(const Scalar& scalar);
  static ECPoint Sum(std::span<const ECPoint> points);

  ECPoint Add(const ECPoint& other) const;
  ECPoint Mul(const Scalar& scalar) const;

  Bytes ToCompressedBytes() const;
  std::string ToHex() const;
  size_t HashValue() const noexcept;

  bool operator==(const ECPoint& other) const;
  bool operator!=(const ECPoint& other) const;
  // Lexicographic order of the compressed encodings.
  bool operator<(const ECPoint& other) const;

 private:
  std::array<uint8_t, kCompressedLen> compressed_{};
};

struct ECPointHash {
  size_t operator()(const ECPoint& point) const noexcept {
    return point.HashValue();
  }
};

}  // namespace nmusig
