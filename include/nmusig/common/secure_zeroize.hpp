#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "nmusig/crypto/scalar.hpp"

namespace nmusig {

inline void SecureZeroizeMemory(void* data, size_t size) noexcept {
  if (data == nullptr || size == 0) {
    return;
  }

  volatile uint8_t* ptr = static_cast<volatile uint8_t*>(data);
  while (size > 0) {
    *ptr = 0;
    ++ptr;
    --size;
  }
}

// Overwrites the limbs in place before resetting, so the old value does not
// survive in the mpz allocation.
inline void SecureZeroize(Scalar* value) noexcept {
  if (value == nullptr) {
    return;
  }
  mpz_ptr raw = const_cast<mpz_ptr>(value->value().get_mpz_t());
  const size_t limbs = mpz_size(raw);
  if (limbs > 0) {
    SecureZeroizeMemory(mpz_limbs_modify(raw, static_cast<mp_size_t>(limbs)),
                        limbs * sizeof(mp_limb_t));
  }
  *value = Scalar();
}

inline void SecureZeroize(std::optional<Scalar>* value) noexcept {
  if (value == nullptr) {
    return;
  }
  if (value->has_value()) {
    SecureZeroize(&value->value());
  }
  value->reset();
}

inline void SecureZeroize(std::vector<Scalar>* values) noexcept {
  if (values == nullptr) {
    return;
  }
  for (Scalar& value : *values) {
    SecureZeroize(&value);
  }
  values->clear();
}

}  // namespace nmusig
