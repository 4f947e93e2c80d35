#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "nmusig/common/thread_pool.hpp"
#include "nmusig/musig/signing_backend.hpp"
#include "nmusig/musig/types.hpp"
#include "nmusig/protocol/node_state.hpp"

namespace nmusig {

// Fan-in of the aggregation tree; passed to SigningBackend::Round1Begin.
inline constexpr uint32_t kTreeArity = 2;

// Post-order round 1 over the whole tree. `store` must already hold one
// entry per leaf; entries for the internal nodes are added here. With a pool
// of more than one worker, disjoint subtrees run concurrently and the nodes
// above them are finished on the calling thread.
//
// Throws ProtocolError: kPrimitiveFailure when a backend call fails,
// kStructuralInconsistency on a missing entry or a repeated write.
void RunRound1(const SigningTree& tree,
               NodeStateStore* store,
               const SigningBackend& backend,
               ThreadPool* pool = nullptr);

// Round 2 over the subtree rooted at `node`. `outer_context` holds the
// ancestors' pre-extension round-1 aggregates and `auth_path` their sibling
// keys, both root first; start from the root with both empty. Every node of
// the subtree must have finished round 1.
//
// Throws ProtocolError: kPrimitiveFailure when a backend call fails,
// kStructuralInconsistency on a single-child internal node, a missing entry
// or secret, or a repeated write.
void RunRound2(const SigningTree& node,
               NodeStateStore* store,
               const SigningBackend& backend,
               std::span<const uint8_t> message,
               const std::vector<Round1Output>& outer_context = {},
               const AuthPath& auth_path = {});

// The root's round-2 pair. kStructuralInconsistency before round 2 finished.
SchnorrSignature ExtractSignature(const SigningTree& tree, const NodeStateStore& store);

// Checks `signature` against the root key. kPrimitiveFailure if the backend
// throws.
bool VerifyTreeSignature(const SigningTree& tree,
                         const SigningBackend& backend,
                         std::span<const uint8_t> message,
                         const SchnorrSignature& signature);

}  // namespace nmusig
