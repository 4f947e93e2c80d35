#include "nmusig/crypto/scalar.hpp"

#include <algorithm>
#include <stdexcept>

namespace nmusig {
namespace {

const mpz_class& GroupOrder() {
  static const mpz_class kOrder(
      "0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141");
  return kOrder;
}

mpz_class ReduceModQ(const mpz_class& input) {
  mpz_class reduced;
  // mpz_mod always yields a non-negative residue.
  mpz_mod(reduced.get_mpz_t(), input.get_mpz_t(), GroupOrder().get_mpz_t());
  return reduced;
}

mpz_class ReadBigEndian(std::span<const uint8_t> bytes) {
  if (bytes.empty()) {
    throw std::invalid_argument("scalar input must not be empty");
  }

  mpz_class out;
  mpz_import(out.get_mpz_t(), bytes.size(), 1, sizeof(uint8_t), 1, 0, bytes.data());
  return out;
}

}  // namespace

Scalar::Scalar() : value_(0) {}

Scalar::Scalar(const mpz_class& value) : value_(ReduceModQ(value)) {}

Scalar Scalar::One() {
  return Scalar(mpz_class(1));
}

Scalar Scalar::FromUint64(uint64_t value) {
  mpz_class wide;
  mpz_import(wide.get_mpz_t(), 1, 1, sizeof(value), 0, 0, &value);
  return Scalar(wide);
}

Scalar Scalar::FromBigEndianModQ(std::span<const uint8_t> bytes) {
  return Scalar(ReadBigEndian(bytes));
}

std::array<uint8_t, 32> Scalar::ToCanonicalBytes() const {
  std::array<uint8_t, 32> out{};
  if (value_ == 0) {
    return out;
  }

  const size_t needed = (mpz_sizeinbase(value_.get_mpz_t(), 2) + 7) / 8;
  if (needed > out.size()) {
    throw std::runtime_error("scalar does not fit in 32 bytes");
  }

  size_t written = 0;
  mpz_export(out.data() + (out.size() - needed), &written, 1, sizeof(uint8_t), 1, 0,
             value_.get_mpz_t());
  return out;
}

const mpz_class& Scalar::value() const {
  return value_;
}

bool Scalar::IsZero() const {
  return value_ == 0;
}

std::vector<Scalar> Scalar::Powers(size_t count) const {
  std::vector<Scalar> out;
  out.reserve(count);
  if (count == 0) {
    return out;
  }
  out.push_back(One());
  for (size_t j = 1; j < count; ++j) {
    out.push_back(out.back() * *this);
  }
  return out;
}

Scalar Scalar::operator+(const Scalar& other) const {
  return Scalar(value_ + other.value_);
}

Scalar Scalar::operator*(const Scalar& other) const {
  return Scalar(value_ * other.value_);
}

Scalar& Scalar::operator+=(const Scalar& other) {
  value_ = ReduceModQ(value_ + other.value_);
  return *this;
}

Scalar& Scalar::operator*=(const Scalar& other) {
  value_ = ReduceModQ(value_ * other.value_);
  return *this;
}

bool Scalar::operator==(const Scalar& other) const {
  return value_ == other.value_;
}

bool Scalar::operator!=(const Scalar& other) const {
  return !(*this == other);
}

const mpz_class& Scalar::ModulusQ() {
  return GroupOrder();
}

}  // namespace nmusig
