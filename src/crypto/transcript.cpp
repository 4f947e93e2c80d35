#include "nmusig/crypto/transcript.hpp"

#include <stdexcept>

#include "nmusig/crypto/hash.hpp"

namespace nmusig {
namespace {

void AppendU32Be(uint32_t value, Bytes* out) {
  out->push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
  out->push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  out->push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  out->push_back(static_cast<uint8_t>(value & 0xFF));
}

void UpdateU32Be(uint32_t value, Sha256Hasher* hasher) {
  Bytes encoded;
  encoded.reserve(4);
  AppendU32Be(value, &encoded);
  hasher->Update(encoded);
}

std::span<const uint8_t> AsByteSpan(std::string_view value) {
  return std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

}  // namespace

Transcript::Transcript(std::string_view domain) {
  append("domain", AsByteSpan(domain));
}

void Transcript::append(std::string_view label, std::span<const uint8_t> data) {
  if (label.size() > UINT32_MAX || data.size() > UINT32_MAX) {
    throw std::invalid_argument("transcript field exceeds uint32 length");
  }

  UpdateU32Be(static_cast<uint32_t>(label.size()), &hasher_);
  hasher_.Update(AsByteSpan(label));

  UpdateU32Be(static_cast<uint32_t>(data.size()), &hasher_);
  hasher_.Update(data);
}

void Transcript::append_point(std::string_view label, const ECPoint& point) {
  append(label, point.ToCompressedBytes());
}

void Transcript::append_u32_be(std::string_view label, uint32_t value) {
  Bytes encoded;
  encoded.reserve(4);
  AppendU32Be(value, &encoded);
  append(label, encoded);
}

Scalar Transcript::challenge_scalar_mod_q() const {
  return Scalar::FromBigEndianModQ(hasher_.Digest());
}

}  // namespace nmusig
