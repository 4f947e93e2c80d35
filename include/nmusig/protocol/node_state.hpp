#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>

#include "nmusig/crypto/ec_point.hpp"
#include "nmusig/crypto/scalar.hpp"
#include "nmusig/musig/types.hpp"
#include "nmusig/tree/aggregation_tree.hpp"

namespace nmusig {

using SigningTree = AggregationTree<ECPoint>;

struct NodeState {
  // Leaves controlled by this process only.
  std::optional<Scalar> secret_key;

  std::optional<Round1State> round1_state;
  // Leaves: the commitment. Internal nodes: the extended aggregate handed
  // to the parent.
  std::optional<Round1Output> round1_output;
  // Internal nodes: the aggregate before extension, used as round-2 context.
  std::optional<Round1Output> round1_internal_output;

  std::optional<ECPoint> round2_state;
  std::optional<Scalar> round2_output;
};

// Per-session signing state keyed by node public key. Secrets held here are
// zeroized when the store is destroyed.
class NodeStateStore {
 public:
  NodeStateStore() = default;
  ~NodeStateStore();

  NodeStateStore(const NodeStateStore&) = delete;
  NodeStateStore& operator=(const NodeStateStore&) = delete;

  // Throws std::invalid_argument if the key is already present.
  void AddLeaf(const ECPoint& key, std::optional<Scalar> secret_key);

  // Creates an empty entry for an internal node. Throws ProtocolError
  // (kStructuralInconsistency) if another node already owns the key.
  void AddInternal(const ECPoint& key);

  NodeState* Find(const ECPoint& key);
  const NodeState* Find(const ECPoint& key) const;

  // Throws ProtocolError (kStructuralInconsistency) when the entry is absent;
  // `what` names the step that expected it.
  NodeState& Require(const ECPoint& key, const char* what);
  const NodeState& Require(const ECPoint& key, const char* what) const;

  size_t size() const;

 private:
  std::unordered_map<ECPoint, NodeState, ECPointHash> entries_;
};

}  // namespace nmusig
