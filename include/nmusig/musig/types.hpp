#pragma once

#include <vector>

#include "nmusig/crypto/ec_point.hpp"
#include "nmusig/crypto/scalar.hpp"

namespace nmusig {

struct KeyPair {
  Scalar secret_key;
  ECPoint public_key;
};

// Secret nonces of one signer; never leaves the signer.
struct Round1State {
  std::vector<Scalar> nonces;
};

// Public nonce points. For a leaf these are r_j * G; for an internal node
// the (extended) aggregate of its subtree.
struct Round1Output {
  std::vector<ECPoint> nonces;

  bool operator==(const Round1Output& other) const {
    return nonces == other.nonces;
  }
};

// Round-2 result of a node: the aggregate nonce point R the share was
// computed against (state) and the partial signature scalar s (output). At
// the root the pair is the final Schnorr signature.
struct Round2Share {
  ECPoint state;
  Scalar output;
};

using SchnorrSignature = Round2Share;

// One entry per tree level from the root down; each entry holds the sibling
// values met at that level.
using AuthPath = std::vector<std::vector<ECPoint>>;

}  // namespace nmusig
