#include "nmusig/protocol/node_state.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "nmusig/common/errors.hpp"
#include "nmusig/common/secure_zeroize.hpp"

namespace nmusig {
namespace {

ProtocolError MissingEntry(const ECPoint& key, const char* what) {
  return ProtocolError(ProtocolErrorKind::kStructuralInconsistency,
                       std::string(what) + ": no state for node " + key.ToHex());
}

}  // namespace

NodeStateStore::~NodeStateStore() {
  for (auto& [key, state] : entries_) {
    (void)key;
    SecureZeroize(&state.secret_key);
    if (state.round1_state.has_value()) {
      SecureZeroize(&state.round1_state->nonces);
    }
  }
}

void NodeStateStore::AddLeaf(const ECPoint& key, std::optional<Scalar> secret_key) {
  NodeState state;
  state.secret_key = std::move(secret_key);
  if (!entries_.emplace(key, std::move(state)).second) {
    throw std::invalid_argument("participant public keys must be unique");
  }
}

void NodeStateStore::AddInternal(const ECPoint& key) {
  if (!entries_.try_emplace(key).second) {
    throw ProtocolError(ProtocolErrorKind::kStructuralInconsistency,
                        "two tree nodes share key " + key.ToHex());
  }
}

NodeState* NodeStateStore::Find(const ECPoint& key) {
  auto it = entries_.find(key);
  return it == entries_.end() ? nullptr : &it->second;
}

const NodeState* NodeStateStore::Find(const ECPoint& key) const {
  auto it = entries_.find(key);
  return it == entries_.end() ? nullptr : &it->second;
}

NodeState& NodeStateStore::Require(const ECPoint& key, const char* what) {
  NodeState* state = Find(key);
  if (state == nullptr) {
    throw MissingEntry(key, what);
  }
  return *state;
}

const NodeState& NodeStateStore::Require(const ECPoint& key, const char* what) const {
  const NodeState* state = Find(key);
  if (state == nullptr) {
    throw MissingEntry(key, what);
  }
  return *state;
}

size_t NodeStateStore::size() const {
  return entries_.size();
}

}  // namespace nmusig
