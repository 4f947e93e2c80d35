#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "nmusig/musig/signing_backend.hpp"
#include "nmusig/musig/types.hpp"

namespace nmusig {

struct NestedMusig2Params {
  // Prefix of every hash domain; signatures made under one tag never verify
  // under another.
  std::string domain = "nmusig/nested-musig2/v1";
};

// MuSig2 with nested key aggregation over secp256k1.
//
// Key aggregation sorts its input, so KeyCombine(a, b) == KeyCombine(b, a).
// Leaves rely on this in Round2Sign: the authentication path carries sibling
// keys without a left/right marker and ancestor keys are recomputed from it.
//
// Nonces: a leaf commits to nu points R_j = r_j G. An internal node X with
// aggregate nonces A_j forwards b^j A_j upward, b = H_ext(X, A). At the root
// the message-bound coefficient b0 = H_non(X_root, A_root, m) folds the nu
// aggregate points into R = sum_j b0^j A_root_j, and a leaf whose ancestors
// carry coefficients b_0..b_{D-1} answers with
//   s = c * alpha * x + sum_j (b_0 * ... * b_{D-1})^j * r_j,
// alpha the product of its key coefficients along the path, c = H_sig(X_root, R, m).
class NestedMusig2 final : public SigningBackend {
 public:
  explicit NestedMusig2(NestedMusig2Params params = {});

  const NestedMusig2Params& params() const;

  ECPoint KeyAggregate(std::span<const ECPoint> keys) const;
  Scalar KeyAggCoefficient(std::span<const ECPoint> sorted_keys, const ECPoint& key) const;

  ECPoint KeyCombine(const ECPoint& lhs, const ECPoint& rhs) const override;

  Round1Commitment Round1Begin(uint32_t participant_count) const override;
  Round1Output Round1Aggregate(std::span<const Round1Output> outputs) const override;
  Round1Output Round1Extend(const Round1Output& aggregate,
                            const ECPoint& tweak_key) const override;

  Round2Share Round2Sign(const Round1State& state,
                         std::span<const Round1Output> outer_context,
                         const Scalar& secret_key,
                         std::span<const uint8_t> message,
                         const AuthPath& auth_path) const override;
  Round2Share Round2Aggregate(std::span<const Round2Share> parts) const override;

  bool Verify(const ECPoint& aggregate_key,
              std::span<const uint8_t> message,
              const SchnorrSignature& signature) const override;

 private:
  Scalar ExtensionCoefficient(const ECPoint& node_key, const Round1Output& aggregate) const;
  Scalar NonceCoefficient(const ECPoint& root_key,
                          const Round1Output& aggregate,
                          std::span<const uint8_t> message) const;
  Scalar Challenge(const ECPoint& root_key,
                   const ECPoint& nonce_point,
                   std::span<const uint8_t> message) const;

  NestedMusig2Params params_;
};

KeyPair GenerateKeyPair();

}  // namespace nmusig
