#include <future>
#include <string>
#include <utility>
#include <vector>

#include "nmusig/common/errors.hpp"
#include "nmusig/protocol/traversal.hpp"

namespace nmusig {
namespace {

template <typename T>
void WriteOnce(std::optional<T>* slot, T value, const char* field, const ECPoint& key) {
  if (slot->has_value()) {
    throw ProtocolError(ProtocolErrorKind::kStructuralInconsistency,
                        std::string(field) + " written twice for node " + key.ToHex());
  }
  *slot = std::move(value);
}

// Every two-child internal node gets its own entry. A single-child node has
// its child's key and therefore shares the child's entry.
void AddInternalEntries(const SigningTree& node, NodeStateStore* store) {
  if (node.is_leaf()) {
    return;
  }
  if (node.right() != nullptr) {
    store->AddInternal(node.value());
    AddInternalEntries(*node.right(), store);
  }
  AddInternalEntries(*node.left(), store);
}

const Round1Output& ChildOutput(const SigningTree& child, const NodeStateStore& store) {
  const NodeState& state = store.Require(child.value(), "round 1 aggregation");
  if (!state.round1_output.has_value()) {
    throw ProtocolError(ProtocolErrorKind::kStructuralInconsistency,
                        "round 1 output missing for child " + child.value().ToHex());
  }
  return *state.round1_output;
}

void Round1Leaf(const SigningTree& leaf, NodeStateStore* store, const SigningBackend& backend) {
  NodeState& state = store->Require(leaf.value(), "round 1 leaf");
  Round1Commitment commitment =
      InvokePrimitive("round1_begin", [&]() { return backend.Round1Begin(kTreeArity); });
  WriteOnce(&state.round1_state, std::move(commitment.state), "round1_state", leaf.value());
  WriteOnce(&state.round1_output, std::move(commitment.output), "round1_output", leaf.value());
}

// Children must be done.
void Round1Internal(const SigningTree& node, NodeStateStore* store, const SigningBackend& backend) {
  const SigningTree* right = node.right();

  Round1Output aggregate;
  if (right != nullptr) {
    const Round1Output children[2] = {ChildOutput(*node.left(), *store),
                                      ChildOutput(*right, *store)};
    aggregate = InvokePrimitive("round1_aggregate",
                                [&]() { return backend.Round1Aggregate(children); });
  } else {
    aggregate = ChildOutput(*node.left(), *store);
  }

  Round1Output extended = InvokePrimitive(
      "round1_extend", [&]() { return backend.Round1Extend(aggregate, node.value()); });

  NodeState& state = store->Require(node.value(), "round 1 internal node");
  if (right == nullptr) {
    // Shared with the child: the extended output replaces the child's as
    // this subtree's contribution upward.
    state.round1_internal_output = std::move(aggregate);
    state.round1_output = std::move(extended);
    return;
  }
  WriteOnce(&state.round1_internal_output, std::move(aggregate), "round1_internal_output",
            node.value());
  WriteOnce(&state.round1_output, std::move(extended), "round1_output", node.value());
}

void Round1Subtree(const SigningTree& node, NodeStateStore* store, const SigningBackend& backend) {
  if (node.is_leaf()) {
    Round1Leaf(node, store, backend);
    return;
  }
  Round1Subtree(*node.left(), store, backend);
  if (node.right() != nullptr) {
    Round1Subtree(*node.right(), store, backend);
  }
  Round1Internal(node, store, backend);
}

// Depth at which the tree is cut into pool tasks: enough subtrees to give
// each worker about two.
size_t ForkDepth(size_t worker_count) {
  size_t depth = 1;
  while ((size_t{1} << depth) < 2 * worker_count && depth < 16) {
    ++depth;
  }
  return depth;
}

void CollectFrontier(const SigningTree& node,
                     size_t depth,
                     size_t fork_depth,
                     std::vector<const SigningTree*>* frontier) {
  if (node.is_leaf() || depth == fork_depth) {
    frontier->push_back(&node);
    return;
  }
  CollectFrontier(*node.left(), depth + 1, fork_depth, frontier);
  if (node.right() != nullptr) {
    CollectFrontier(*node.right(), depth + 1, fork_depth, frontier);
  }
}

void Round1AboveFrontier(const SigningTree& node,
                         size_t depth,
                         size_t fork_depth,
                         NodeStateStore* store,
                         const SigningBackend& backend) {
  if (node.is_leaf() || depth == fork_depth) {
    return;
  }
  Round1AboveFrontier(*node.left(), depth + 1, fork_depth, store, backend);
  if (node.right() != nullptr) {
    Round1AboveFrontier(*node.right(), depth + 1, fork_depth, store, backend);
  }
  Round1Internal(node, store, backend);
}

void WaitForAll(const std::vector<std::future<void>>& futures) {
  for (const std::future<void>& future : futures) {
    future.wait();
  }
}

}  // namespace

void RunRound1(const SigningTree& tree,
               NodeStateStore* store,
               const SigningBackend& backend,
               ThreadPool* pool) {
  // All entries exist before any subtree starts, so concurrent subtrees
  // only look up and fill distinct entries.
  AddInternalEntries(tree, store);

  if (pool == nullptr || pool->worker_count() < 2 || tree.is_leaf()) {
    Round1Subtree(tree, store, backend);
    return;
  }

  const size_t fork_depth = ForkDepth(pool->worker_count());
  std::vector<const SigningTree*> frontier;
  CollectFrontier(tree, 0, fork_depth, &frontier);

  // Subtrees reference this frame, so every submitted one must finish
  // before anything propagates.
  std::vector<std::future<void>> pending;
  pending.reserve(frontier.size());
  try {
    for (const SigningTree* subtree : frontier) {
      pending.push_back(
          pool->Submit([subtree, store, &backend]() { Round1Subtree(*subtree, store, backend); }));
    }
  } catch (const std::exception&) {
    WaitForAll(pending);
    throw;
  }
  WaitForAll(pending);
  for (std::future<void>& future : pending) {
    future.get();
  }

  Round1AboveFrontier(tree, 0, fork_depth, store, backend);
}

}  // namespace nmusig
