#pragma once

#include <cstdint>
#include <span>

#include "nmusig/musig/types.hpp"

namespace nmusig {

struct Round1Commitment {
  Round1State state;
  Round1Output output;
};

// Pairwise signing capability driven by the tree traversals. Implementations
// report failures by throwing standard exceptions; callers treat any throw
// as fatal for the session. Implementations must be callable concurrently
// from several threads.
class SigningBackend {
 public:
  virtual ~SigningBackend() = default;

  virtual ECPoint KeyCombine(const ECPoint& lhs, const ECPoint& rhs) const = 0;

  virtual Round1Commitment Round1Begin(uint32_t participant_count) const = 0;
  virtual Round1Output Round1Aggregate(std::span<const Round1Output> outputs) const = 0;
  virtual Round1Output Round1Extend(const Round1Output& aggregate,
                                    const ECPoint& tweak_key) const = 0;

  virtual Round2Share Round2Sign(const Round1State& state,
                                 std::span<const Round1Output> outer_context,
                                 const Scalar& secret_key,
                                 std::span<const uint8_t> message,
                                 const AuthPath& auth_path) const = 0;
  virtual Round2Share Round2Aggregate(std::span<const Round2Share> parts) const = 0;

  virtual bool Verify(const ECPoint& aggregate_key,
                      std::span<const uint8_t> message,
                      const SchnorrSignature& signature) const = 0;
};

}  // namespace nmusig
