#include "nmusig/crypto/ec_point.hpp"

#include <functional>
#include <stdexcept>
#include <string_view>
#include <vector>

extern "C" {
#include <secp256k1.h>
}

namespace nmusig {
namespace {

// libsecp256k1 contexts are safe for concurrent use by const-context calls,
// which is all this file makes after creation.
const secp256k1_context* SecpContext() {
  static secp256k1_context* ctx = []() {
    secp256k1_context* created =
        secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
    if (created == nullptr) {
      throw std::runtime_error("failed to create secp256k1 context");
    }
    return created;
  }();
  return ctx;
}

secp256k1_pubkey Parse(const std::array<uint8_t, ECPoint::kCompressedLen>& compressed) {
  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_parse(SecpContext(), &pubkey, compressed.data(), compressed.size()) != 1) {
    throw std::invalid_argument("bytes do not encode a secp256k1 point");
  }
  return pubkey;
}

std::array<uint8_t, ECPoint::kCompressedLen> Serialize(const secp256k1_pubkey& pubkey) {
  std::array<uint8_t, ECPoint::kCompressedLen> out{};
  size_t out_len = out.size();
  if (secp256k1_ec_pubkey_serialize(SecpContext(), out.data(), &out_len, &pubkey,
                                    SECP256K1_EC_COMPRESSED) != 1 ||
      out_len != out.size()) {
    throw std::runtime_error("failed to serialize secp256k1 point");
  }
  return out;
}

}  // namespace

ECPoint::ECPoint() {
  compressed_.fill(0);
  compressed_[0] = 0x02;
}

ECPoint ECPoint::GeneratorMultiply(const Scalar& scalar) {
  const std::array<uint8_t, 32> scalar_bytes = scalar.ToCanonicalBytes();

  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_create(SecpContext(), &pubkey, scalar_bytes.data()) != 1) {
    throw std::invalid_argument("generator multiplication needs a scalar in [1, q-1]");
  }

  ECPoint out;
  out.compressed_ = Serialize(pubkey);
  return out;
}

ECPoint ECPoint::Sum(std::span<const ECPoint> points) {
  if (points.empty()) {
    throw std::invalid_argument("cannot sum an empty set of points");
  }
  if (points.size() == 1) {
    return points.front();
  }

  std::vector<secp256k1_pubkey> parsed;
  parsed.reserve(points.size());
  for (const ECPoint& point : points) {
    parsed.push_back(Parse(point.compressed_));
  }
  std::vector<const secp256k1_pubkey*> inputs;
  inputs.reserve(parsed.size());
  for (const secp256k1_pubkey& pubkey : parsed) {
    inputs.push_back(&pubkey);
  }

  secp256k1_pubkey combined;
  if (secp256k1_ec_pubkey_combine(SecpContext(), &combined, inputs.data(), inputs.size()) != 1) {
    throw std::invalid_argument("point sum is the point at infinity");
  }

  ECPoint out;
  out.compressed_ = Serialize(combined);
  return out;
}

ECPoint ECPoint::Add(const ECPoint& other) const {
  const ECPoint terms[2] = {*this, other};
  return Sum(terms);
}

ECPoint ECPoint::Mul(const Scalar& scalar) const {
  secp256k1_pubkey pubkey = Parse(compressed_);
  const std::array<uint8_t, 32> scalar_bytes = scalar.ToCanonicalBytes();

  if (secp256k1_ec_pubkey_tweak_mul(SecpContext(), &pubkey, scalar_bytes.data()) != 1) {
    throw std::invalid_argument("point multiplication needs a scalar in [1, q-1]");
  }

  ECPoint out;
  out.compressed_ = Serialize(pubkey);
  return out;
}

Bytes ECPoint::ToCompressedBytes() const {
  return Bytes(compressed_.begin(), compressed_.end());
}

std::string ECPoint::ToHex() const {
  return nmusig::ToHex(compressed_);
}

size_t ECPoint::HashValue() const noexcept {
  const std::string_view view(reinterpret_cast<const char*>(compressed_.data()), compressed_.size());
  return std::hash<std::string_view>{}(view);
}

bool ECPoint::operator==(const ECPoint& other) const {
  return compressed_ == other.compressed_;
}

bool ECPoint::operator!=(const ECPoint& other) const {
  return !(*this == other);
}

bool ECPoint::operator<(const ECPoint& other) const {
  return compressed_ < other.compressed_;
}

}  // namespace nmusig
