#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

#include "nmusig/common/errors.hpp"

namespace nmusig {

// Immutable binary tree whose every node carries a value of type V. Internal
// values are always derived from the children (combined, or propagated from
// a lone left child) and cannot be set directly. Children are owned by their
// parent; nodes hold no back-pointers.
template <typename V>
class AggregationTree {
 public:
  using Combine = std::function<V(const V&, const V&)>;

  static AggregationTree Leaf(V value) {
    return AggregationTree(LeafNode{std::move(value)});
  }

  static AggregationTree Join(AggregationTree left, AggregationTree right, const Combine& combine) {
    V value = combine(left.value(), right.value());
    return AggregationTree(InternalNode{std::make_unique<AggregationTree>(std::move(left)),
                                        std::make_unique<AggregationTree>(std::move(right)),
                                        std::move(value)});
  }

  // Single-child internal node carrying its child's value upward. The
  // builder never produces this shape.
  static AggregationTree Lift(AggregationTree child) {
    V value = child.value();
    return AggregationTree(InternalNode{std::make_unique<AggregationTree>(std::move(child)),
                                        nullptr,
                                        std::move(value)});
  }

  // Pairs (2i, 2i+1) level by level, carrying an odd trailing node up as is,
  // until a single root remains. The shape depends only on leaves.size().
  static AggregationTree FromLeaves(std::vector<V> leaves, const Combine& combine) {
    if (leaves.empty()) {
      throw ProtocolError(ProtocolErrorKind::kEmptyInput,
                          "cannot build an aggregation tree from zero leaves");
    }
    if (!combine) {
      throw std::invalid_argument("aggregation tree combine function must be set");
    }

    std::vector<AggregationTree> level;
    level.reserve(leaves.size());
    for (V& value : leaves) {
      level.push_back(Leaf(std::move(value)));
    }

    while (level.size() > 1) {
      std::vector<AggregationTree> next;
      next.reserve((level.size() + 1) / 2);
      for (size_t i = 0; i < level.size(); i += 2) {
        if (i + 1 < level.size()) {
          next.push_back(Join(std::move(level[i]), std::move(level[i + 1]), combine));
        } else {
          next.push_back(std::move(level[i]));
        }
      }
      level = std::move(next);
    }
    return std::move(level.front());
  }

  AggregationTree(AggregationTree&&) noexcept = default;
  AggregationTree& operator=(AggregationTree&&) noexcept = default;
  AggregationTree(const AggregationTree&) = delete;
  AggregationTree& operator=(const AggregationTree&) = delete;

  const V& value() const {
    return std::visit([](const auto& node) -> const V& { return node.value; }, node_);
  }

  bool is_leaf() const {
    return std::holds_alternative<LeafNode>(node_);
  }

  bool is_internal() const {
    return std::holds_alternative<InternalNode>(node_);
  }

  // nullptr for leaves.
  const AggregationTree* left() const {
    const InternalNode* internal = std::get_if<InternalNode>(&node_);
    return internal == nullptr ? nullptr : internal->left.get();
  }

  // nullptr for leaves and single-child internal nodes.
  const AggregationTree* right() const {
    const InternalNode* internal = std::get_if<InternalNode>(&node_);
    return internal == nullptr ? nullptr : internal->right.get();
  }

  // A lone leaf has height 1.
  size_t height() const {
    if (is_leaf()) {
      return 1;
    }
    const size_t left_height = left()->height();
    const size_t right_height = right() == nullptr ? 0 : right()->height();
    return 1 + std::max(left_height, right_height);
  }

  size_t leaf_count() const {
    if (is_leaf()) {
      return 1;
    }
    return left()->leaf_count() + (right() == nullptr ? 0 : right()->leaf_count());
  }

  size_t internal_count() const {
    if (is_leaf()) {
      return 0;
    }
    return 1 + left()->internal_count() + (right() == nullptr ? 0 : right()->internal_count());
  }

  // Leaf values left to right.
  std::vector<V> leaf_values() const {
    std::vector<V> out;
    out.reserve(leaf_count());
    CollectLeaves(&out);
    return out;
  }

 private:
  struct LeafNode {
    V value;
  };

  struct InternalNode {
    std::unique_ptr<AggregationTree> left;
    std::unique_ptr<AggregationTree> right;
    V value;
  };

  explicit AggregationTree(LeafNode node) : node_(std::move(node)) {}
  explicit AggregationTree(InternalNode node) : node_(std::move(node)) {}

  void CollectLeaves(std::vector<V>* out) const {
    if (is_leaf()) {
      out->push_back(value());
      return;
    }
    left()->CollectLeaves(out);
    if (right() != nullptr) {
      right()->CollectLeaves(out);
    }
  }

  std::variant<LeafNode, InternalNode> node_;
};

}  // namespace nmusig
