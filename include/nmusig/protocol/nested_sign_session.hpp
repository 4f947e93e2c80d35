#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "nmusig/common/bytes.hpp"
#include "nmusig/crypto/ec_point.hpp"
#include "nmusig/crypto/scalar.hpp"
#include "nmusig/musig/signing_backend.hpp"
#include "nmusig/protocol/node_state.hpp"
#include "nmusig/protocol/session.hpp"

namespace nmusig {

enum class NestedSignPhase : uint32_t {
  kRound1 = 1,
  kRound2 = 2,
  kCompleted = 3,
};

struct NestedSignSessionConfig {
  Bytes session_id;
  // Leaf order of the aggregation tree.
  std::vector<ECPoint> participants;
  // One secret per participant; every leaf signs in round 2. The secret is
  // not checked against its public key; a wrong secret yields a signature
  // that fails verification.
  std::unordered_map<ECPoint, Scalar, ECPointHash> local_secret_keys;
  Bytes message;
  std::shared_ptr<const SigningBackend> backend;
  // Run round 1 on the shared pool sized by NMUSIG_ROUND1_THREADS.
  bool parallel_round1 = true;
};

struct NestedSignResult {
  ECPoint aggregate_key;
  SchnorrSignature signature;
  bool verified = false;
  size_t tree_height = 0;
  size_t leaf_count = 0;
};

// One signing run over a fixed participant list: round 1, round 2, then
// signature extraction. Any protocol failure aborts the session for good.
class NestedSignSession : public Session {
 public:
  // Throws ProtocolError (kEmptyInput) for an empty participant list and
  // std::invalid_argument for other configuration errors.
  explicit NestedSignSession(NestedSignSessionConfig cfg);
  ~NestedSignSession() override;

  NestedSignPhase phase() const;

  const SigningTree& tree() const;
  const ECPoint& aggregate_key() const;
  const NodeStateStore& store() const;

  void RunRound1();
  void RunRound2();

  bool HasSignature() const;
  const SchnorrSignature& signature() const;
  bool VerifySignature() const;

  // Runs every remaining step, verifies, then drops the per-node state.
  NestedSignResult Run();

  // Zeroizes and discards the per-node state; store() is unusable afterwards.
  void ReleaseState();

 private:
  void RequirePhase(NestedSignPhase expected, const char* step) const;

  NestedSignSessionConfig cfg_;
  std::unique_ptr<SigningTree> tree_;
  std::unique_ptr<NodeStateStore> store_;
  NestedSignPhase phase_ = NestedSignPhase::kRound1;
  std::optional<SchnorrSignature> signature_;
};

}  // namespace nmusig
