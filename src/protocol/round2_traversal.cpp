#include <string>
#include <utility>
#include <vector>

#include "nmusig/common/errors.hpp"
#include "nmusig/protocol/traversal.hpp"

namespace nmusig {
namespace {

ProtocolError Inconsistent(const std::string& message, const ECPoint& key) {
  return ProtocolError(ProtocolErrorKind::kStructuralInconsistency,
                       message + " at node " + key.ToHex());
}

void StoreShare(NodeState* state, Round2Share share, const ECPoint& key) {
  if (state->round2_state.has_value() || state->round2_output.has_value()) {
    throw Inconsistent("round 2 result written twice", key);
  }
  state->round2_state = std::move(share.state);
  state->round2_output = std::move(share.output);
}

Round2Share LoadShare(const SigningTree& node, const NodeStateStore& store) {
  const NodeState& state = store.Require(node.value(), "round 2 aggregation");
  if (!state.round2_state.has_value() || !state.round2_output.has_value()) {
    throw Inconsistent("round 2 result missing", node.value());
  }
  return Round2Share{*state.round2_state, *state.round2_output};
}

AuthPath ExtendPath(const AuthPath& path, const ECPoint& sibling) {
  AuthPath extended = path;
  extended.push_back({sibling});
  return extended;
}

void Round2Leaf(const SigningTree& leaf,
                NodeStateStore* store,
                const SigningBackend& backend,
                std::span<const uint8_t> message,
                const std::vector<Round1Output>& outer_context,
                const AuthPath& auth_path) {
  NodeState& state = store->Require(leaf.value(), "round 2 leaf");
  if (!state.round1_state.has_value()) {
    throw Inconsistent("round 1 state missing", leaf.value());
  }
  if (!state.secret_key.has_value()) {
    throw Inconsistent("no local secret key", leaf.value());
  }

  Round2Share share = InvokePrimitive("round2_sign", [&]() {
    return backend.Round2Sign(*state.round1_state, outer_context, *state.secret_key, message,
                              auth_path);
  });
  StoreShare(&state, std::move(share), leaf.value());
}

}  // namespace

void RunRound2(const SigningTree& node,
               NodeStateStore* store,
               const SigningBackend& backend,
               std::span<const uint8_t> message,
               const std::vector<Round1Output>& outer_context,
               const AuthPath& auth_path) {
  if (node.is_leaf()) {
    Round2Leaf(node, store, backend, message, outer_context, auth_path);
    return;
  }

  const SigningTree& left = *node.left();
  const SigningTree* right = node.right();
  if (right == nullptr) {
    // The builder never emits this shape; reaching it means the tree and the
    // traversal disagree.
    throw Inconsistent("round 2 reached a single-child internal node", node.value());
  }

  const NodeState& own = store->Require(node.value(), "round 2 internal node");
  if (!own.round1_internal_output.has_value()) {
    throw Inconsistent("round 1 aggregate missing", node.value());
  }

  std::vector<Round1Output> child_context = outer_context;
  child_context.push_back(*own.round1_internal_output);

  RunRound2(left, store, backend, message, child_context, ExtendPath(auth_path, right->value()));
  RunRound2(*right, store, backend, message, child_context, ExtendPath(auth_path, left.value()));

  const Round2Share parts[2] = {LoadShare(left, *store), LoadShare(*right, *store)};
  Round2Share combined =
      InvokePrimitive("round2_aggregate", [&]() { return backend.Round2Aggregate(parts); });
  StoreShare(&store->Require(node.value(), "round 2 internal node"), std::move(combined),
             node.value());
}

SchnorrSignature ExtractSignature(const SigningTree& tree, const NodeStateStore& store) {
  const NodeState& root = store.Require(tree.value(), "signature extraction");
  if (!root.round2_state.has_value() || !root.round2_output.has_value()) {
    throw Inconsistent("signature requested before round 2 finished", tree.value());
  }
  return SchnorrSignature{*root.round2_state, *root.round2_output};
}

bool VerifyTreeSignature(const SigningTree& tree,
                         const SigningBackend& backend,
                         std::span<const uint8_t> message,
                         const SchnorrSignature& signature) {
  return InvokePrimitive("verify",
                         [&]() { return backend.Verify(tree.value(), message, signature); });
}

}  // namespace nmusig
