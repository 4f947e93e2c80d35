#include "nmusig/crypto/random.hpp"

#include <stdexcept>

#include <openssl/rand.h>

namespace nmusig {

Bytes Csprng::RandomBytes(size_t size) {
  Bytes out(size);
  if (size == 0) {
    return out;
  }

  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return out;
}

Scalar Csprng::RandomNonZeroScalar() {
  // Rejection sampling: out-of-range and zero draws are discarded.
  while (true) {
    const Bytes bytes = RandomBytes(32);
    mpz_class candidate;
    mpz_import(candidate.get_mpz_t(), bytes.size(), 1, sizeof(uint8_t), 1, 0, bytes.data());
    if (candidate == 0 || candidate >= Scalar::ModulusQ()) {
      continue;
    }
    return Scalar(candidate);
  }
}

}  // namespace nmusig
