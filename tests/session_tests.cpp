#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "nmusig/common/bytes.hpp"
#include "nmusig/common/errors.hpp"
#include "nmusig/common/logging.hpp"
#include "nmusig/common/secure_zeroize.hpp"
#include "nmusig/musig/nested_musig2.hpp"
#include "nmusig/protocol/nested_sign_session.hpp"

INITIALIZE_EASYLOGGINGPP

namespace {

using nmusig::Bytes;
using nmusig::ECPoint;
using nmusig::GenerateKeyPair;
using nmusig::KeyPair;
using nmusig::NestedMusig2;
using nmusig::NestedSignPhase;
using nmusig::NestedSignResult;
using nmusig::NestedSignSession;
using nmusig::NestedSignSessionConfig;
using nmusig::ProtocolError;
using nmusig::ProtocolErrorKind;
using nmusig::Round1Output;
using nmusig::SessionStatus;
using nmusig::SigningBackend;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

template <typename Exception>
void ExpectThrowAs(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const Exception&) {
    return;
  } catch (const std::exception& ex) {
    throw std::runtime_error("Unexpected exception type for: " + message + " (" + ex.what() + ")");
  }
  throw std::runtime_error("Expected exception: " + message);
}

void ExpectProtocolError(const std::function<void()>& fn,
                         ProtocolErrorKind expected,
                         const std::string& message) {
  try {
    fn();
  } catch (const ProtocolError& ex) {
    Expect(ex.kind() == expected, message + " (wrong kind: " + ex.what() + ")");
    return;
  }
  throw std::runtime_error("Expected ProtocolError: " + message);
}

Bytes MessageBytes(const std::string& text) {
  return Bytes(text.begin(), text.end());
}

// Honest except for Round1Extend.
class ExtendFailsBackend final : public SigningBackend {
 public:
  ECPoint KeyCombine(const ECPoint& lhs, const ECPoint& rhs) const override {
    return inner_.KeyCombine(lhs, rhs);
  }
  nmusig::Round1Commitment Round1Begin(uint32_t participant_count) const override {
    return inner_.Round1Begin(participant_count);
  }
  Round1Output Round1Aggregate(std::span<const Round1Output> outputs) const override {
    return inner_.Round1Aggregate(outputs);
  }
  Round1Output Round1Extend(const Round1Output&, const ECPoint&) const override {
    throw std::runtime_error("extension unavailable");
  }
  nmusig::Round2Share Round2Sign(const nmusig::Round1State& state,
                                 std::span<const Round1Output> outer_context,
                                 const nmusig::Scalar& secret_key,
                                 std::span<const uint8_t> message,
                                 const nmusig::AuthPath& auth_path) const override {
    return inner_.Round2Sign(state, outer_context, secret_key, message, auth_path);
  }
  nmusig::Round2Share Round2Aggregate(std::span<const nmusig::Round2Share> parts) const override {
    return inner_.Round2Aggregate(parts);
  }
  bool Verify(const ECPoint& aggregate_key,
              std::span<const uint8_t> message,
              const nmusig::SchnorrSignature& signature) const override {
    return inner_.Verify(aggregate_key, message, signature);
  }

 private:
  NestedMusig2 inner_;
};

NestedSignSessionConfig MakeConfig(size_t participant_count, bool parallel_round1 = false) {
  NestedSignSessionConfig cfg;
  cfg.session_id = MessageBytes("session-test-id");
  for (size_t i = 0; i < participant_count; ++i) {
    KeyPair pair = GenerateKeyPair();
    cfg.participants.push_back(pair.public_key);
    cfg.local_secret_keys.emplace(pair.public_key, pair.secret_key);
    nmusig::SecureZeroize(&pair.secret_key);
  }
  cfg.message = MessageBytes("test tx message");
  cfg.backend = std::make_shared<const NestedMusig2>();
  cfg.parallel_round1 = parallel_round1;
  return cfg;
}

void TestRunProducesVerifiedSignature() {
  for (size_t n : {1u, 2u, 7u}) {
    NestedSignSession session(MakeConfig(n));
    const NestedSignResult result = session.Run();
    const std::string at = " for n=" + std::to_string(n);
    Expect(result.verified, "signature verifies" + at);
    Expect(result.leaf_count == n, "leaf count" + at);
    Expect(result.aggregate_key == session.aggregate_key(), "aggregate key matches the tree" + at);
    Expect(session.status() == SessionStatus::kCompleted, "session completes" + at);
    Expect(session.phase() == NestedSignPhase::kCompleted, "phase completes" + at);
    ExpectThrowAs<std::logic_error>([&]() { (void)session.store(); },
                                    "state is released after Run" + at);
  }

  NestedSignSession parallel(MakeConfig(12, true));
  Expect(parallel.Run().verified, "parallel round 1 session verifies");
}

void TestStepwisePhases() {
  NestedSignSession session(MakeConfig(5));
  Expect(session.status() == SessionStatus::kRunning, "new session is running");
  Expect(session.phase() == NestedSignPhase::kRound1, "new session starts in round 1");
  Expect(session.tree().leaf_count() == 5, "tree spans every participant");
  Expect(session.tree().height() == 4, "five participants give height 4");
  Expect(session.store().size() == 5, "store starts with one entry per leaf");
  Expect(!session.HasSignature(), "no signature before round 2");
  Expect(session.session_id() == MessageBytes("session-test-id"), "session id is kept");
  Expect(session.session_tag() == "73657373696f6e2d", "session tag is the id's first 8 bytes");
  Expect(std::string(nmusig::SessionStatusName(session.status())) == "running",
         "status name");

  ExpectThrowAs<std::logic_error>([&]() { session.RunRound2(); }, "round 2 before round 1");
  ExpectThrowAs<std::logic_error>([&]() { (void)session.signature(); },
                                  "signature before round 2");

  session.RunRound1();
  Expect(session.phase() == NestedSignPhase::kRound2, "round 1 advances the phase");
  Expect(session.store().size() == 9, "round 1 adds the internal nodes");
  ExpectThrowAs<std::logic_error>([&]() { session.RunRound1(); }, "round 1 twice");

  session.RunRound2();
  Expect(session.status() == SessionStatus::kCompleted, "round 2 completes the session");
  Expect(session.HasSignature(), "signature available after round 2");
  Expect(session.VerifySignature(), "stepwise signature verifies");
  ExpectThrowAs<std::logic_error>([&]() { session.RunRound2(); }, "round 2 twice");

  session.ReleaseState();
  ExpectThrowAs<std::logic_error>([&]() { (void)session.store(); }, "store after release");
  Expect(session.VerifySignature(), "signature still verifies after release");
}

void TestInvalidConfigurations() {
  ExpectProtocolError([]() { NestedSignSession session(MakeConfig(0)); },
                      ProtocolErrorKind::kEmptyInput, "no participants");

  ExpectThrowAs<std::invalid_argument>(
      []() {
        NestedSignSessionConfig cfg = MakeConfig(3);
        cfg.participants.push_back(cfg.participants.front());
        NestedSignSession session(std::move(cfg));
      },
      "duplicate participant keys");

  ExpectThrowAs<std::invalid_argument>(
      []() {
        NestedSignSessionConfig cfg = MakeConfig(2);
        cfg.backend.reset();
        NestedSignSession session(std::move(cfg));
      },
      "missing backend");

  ExpectThrowAs<std::invalid_argument>(
      []() {
        NestedSignSessionConfig cfg = MakeConfig(2);
        cfg.session_id.clear();
        NestedSignSession session(std::move(cfg));
      },
      "empty session id");

  ExpectThrowAs<std::invalid_argument>(
      []() {
        NestedSignSessionConfig cfg = MakeConfig(2);
        const KeyPair stranger = GenerateKeyPair();
        cfg.local_secret_keys.emplace(stranger.public_key, stranger.secret_key);
        NestedSignSession session(std::move(cfg));
      },
      "secret key for a non-participant");
}

void TestBackendFailureAbortsSession() {
  NestedSignSessionConfig cfg = MakeConfig(4);
  cfg.backend = std::make_shared<const ExtendFailsBackend>();
  NestedSignSession session(std::move(cfg));

  ExpectProtocolError([&]() { session.RunRound1(); }, ProtocolErrorKind::kPrimitiveFailure,
                      "failing extension aborts round 1");
  Expect(session.status() == SessionStatus::kAborted, "session is aborted");
  Expect(std::string(nmusig::SessionStatusName(session.status())) == "aborted", "status name");
  Expect(session.abort_reason().find("round1_extend") != std::string::npos,
         "abort reason names the failed operation");
  ExpectThrowAs<std::logic_error>([&]() { session.RunRound1(); }, "aborted session cannot resume");
  ExpectThrowAs<std::logic_error>([&]() { session.RunRound2(); }, "aborted session cannot continue");
}

void TestMissingLocalSecretIsRejected() {
  ExpectThrowAs<std::invalid_argument>(
      []() {
        NestedSignSessionConfig cfg = MakeConfig(3);
        cfg.local_secret_keys.erase(cfg.participants.back());
        NestedSignSession session(std::move(cfg));
      },
      "a participant without a local secret");

  ExpectThrowAs<std::invalid_argument>(
      []() {
        NestedSignSessionConfig cfg = MakeConfig(4);
        cfg.local_secret_keys.clear();
        NestedSignSession session(std::move(cfg));
      },
      "no local secrets at all");
}

}  // namespace

int main() {
  try {
    TestRunProducesVerifiedSignature();
    TestStepwisePhases();
    TestInvalidConfigurations();
    TestBackendFailureAbortsSession();
    TestMissingLocalSecretIsRejected();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Session tests passed" << '\n';
  return 0;
}
