#pragma once

#include <cstddef>

#include "nmusig/common/bytes.hpp"
#include "nmusig/crypto/scalar.hpp"

namespace nmusig {

class Csprng {
 public:
  static Bytes RandomBytes(size_t size);
  // Uniform in [1, q-1]; usable as a secret key or nonce.
  static Scalar RandomNonZeroScalar();
};

}  // namespace nmusig
