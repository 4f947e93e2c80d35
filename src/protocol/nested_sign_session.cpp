#include "nmusig/protocol/nested_sign_session.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>

#include "nmusig/common/errors.hpp"
#include "nmusig/common/logging.hpp"
#include "nmusig/common/secure_zeroize.hpp"
#include "nmusig/common/thread_pool.hpp"
#include "nmusig/protocol/traversal.hpp"

namespace nmusig {
namespace {

size_t ResolveRound1WorkerCount() {
  const char* env = std::getenv("NMUSIG_ROUND1_THREADS");
  if (env != nullptr && env[0] != '\0') {
    char* end = nullptr;
    const unsigned long parsed = std::strtoul(env, &end, 10);
    if (end != env && end != nullptr && *end == '\0' && parsed > 0) {
      return static_cast<size_t>(parsed);
    }
  }

  const unsigned int hw = std::thread::hardware_concurrency();
  return std::max<size_t>(1, hw == 0 ? 1 : hw);
}

ThreadPool& Round1ThreadPool() {
  static ThreadPool pool(ResolveRound1WorkerCount());
  return pool;
}

void ValidateConfigOrThrow(const NestedSignSessionConfig& cfg) {
  if (!cfg.backend) {
    throw std::invalid_argument("NestedSignSession requires a signing backend");
  }

  std::unordered_set<ECPoint, ECPointHash> dedup;
  for (const ECPoint& participant : cfg.participants) {
    if (!dedup.insert(participant).second) {
      throw std::invalid_argument("participant public keys must be unique");
    }
  }

  for (const auto& [public_key, secret_key] : cfg.local_secret_keys) {
    (void)secret_key;
    if (dedup.count(public_key) == 0) {
      throw std::invalid_argument("local secret key given for a non-participant " +
                                  public_key.ToHex());
    }
  }
  // Round 2 signs at every leaf.
  for (const ECPoint& participant : cfg.participants) {
    if (cfg.local_secret_keys.count(participant) == 0) {
      throw std::invalid_argument("no local secret key for participant " + participant.ToHex());
    }
  }
}

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
      .count();
}

}  // namespace

NestedSignSession::NestedSignSession(NestedSignSessionConfig cfg)
    : Session(cfg.session_id), cfg_(std::move(cfg)) {
  ValidateConfigOrThrow(cfg_);

  const SigningBackend& backend = *cfg_.backend;
  tree_ = std::make_unique<SigningTree>(SigningTree::FromLeaves(
      cfg_.participants,
      [&backend](const ECPoint& lhs, const ECPoint& rhs) {
        return InvokePrimitive("key_combine", [&]() { return backend.KeyCombine(lhs, rhs); });
      }));

  store_ = std::make_unique<NodeStateStore>();
  for (const ECPoint& participant : cfg_.participants) {
    store_->AddLeaf(participant, cfg_.local_secret_keys.at(participant));
  }

  LOG(INFO) << "session " << session_tag() << ": " << tree_->leaf_count()
            << " participants, tree height " << tree_->height() << ", aggregate key "
            << tree_->value().ToHex();
}

NestedSignSession::~NestedSignSession() {
  for (auto& [public_key, secret_key] : cfg_.local_secret_keys) {
    (void)public_key;
    SecureZeroize(&secret_key);
  }
}

NestedSignPhase NestedSignSession::phase() const {
  return phase_;
}

const SigningTree& NestedSignSession::tree() const {
  return *tree_;
}

const ECPoint& NestedSignSession::aggregate_key() const {
  return tree_->value();
}

const NodeStateStore& NestedSignSession::store() const {
  if (!store_) {
    throw std::logic_error("session state has been released");
  }
  return *store_;
}

void NestedSignSession::RequirePhase(NestedSignPhase expected, const char* step) const {
  if (status() == SessionStatus::kAborted) {
    throw std::logic_error(std::string(step) + " called on aborted session: " + abort_reason());
  }
  if (phase_ != expected) {
    throw std::logic_error(std::string(step) + " called in the wrong phase");
  }
  if (!store_) {
    throw std::logic_error(std::string(step) + " called after state was released");
  }
}

void NestedSignSession::RunRound1() {
  RequirePhase(NestedSignPhase::kRound1, "RunRound1");

  const auto start = std::chrono::steady_clock::now();
  ThreadPool* pool = cfg_.parallel_round1 ? &Round1ThreadPool() : nullptr;
  try {
    nmusig::RunRound1(*tree_, store_.get(), *cfg_.backend, pool);
  } catch (const ProtocolError& ex) {
    Abort(ex.what());
    LOG(ERROR) << "session " << session_tag() << " aborted in round 1: " << ex.what();
    throw;
  }

  phase_ = NestedSignPhase::kRound2;
  VLOG(1) << "session " << session_tag() << ": round 1 done in " << ElapsedMs(start) << " ms ("
          << store_->size() << " nodes"
          << (pool == nullptr ? "" : ", parallel") << ")";
}

void NestedSignSession::RunRound2() {
  RequirePhase(NestedSignPhase::kRound2, "RunRound2");

  const auto start = std::chrono::steady_clock::now();
  try {
    nmusig::RunRound2(*tree_, store_.get(), *cfg_.backend, cfg_.message);
    signature_ = ExtractSignature(*tree_, *store_);
  } catch (const ProtocolError& ex) {
    Abort(ex.what());
    LOG(ERROR) << "session " << session_tag() << " aborted in round 2: " << ex.what();
    throw;
  }

  phase_ = NestedSignPhase::kCompleted;
  Complete();
  VLOG(1) << "session " << session_tag() << ": round 2 done in " << ElapsedMs(start) << " ms";
}

bool NestedSignSession::HasSignature() const {
  return signature_.has_value();
}

const SchnorrSignature& NestedSignSession::signature() const {
  if (!signature_.has_value()) {
    throw std::logic_error("signature is not available before round 2 completes");
  }
  return *signature_;
}

bool NestedSignSession::VerifySignature() const {
  const bool verified = VerifyTreeSignature(*tree_, *cfg_.backend, cfg_.message, signature());
  if (verified) {
    LOG(INFO) << "session " << session_tag() << ": signature verified";
  } else {
    LOG(WARNING) << "session " << session_tag() << ": signature rejected";
  }
  return verified;
}

NestedSignResult NestedSignSession::Run() {
  if (phase_ == NestedSignPhase::kRound1) {
    RunRound1();
  }
  if (phase_ == NestedSignPhase::kRound2) {
    RunRound2();
  }

  NestedSignResult result;
  result.aggregate_key = aggregate_key();
  result.signature = signature();
  result.verified = VerifySignature();
  result.tree_height = tree_->height();
  result.leaf_count = tree_->leaf_count();

  ReleaseState();
  return result;
}

void NestedSignSession::ReleaseState() {
  store_.reset();
}

}  // namespace nmusig
