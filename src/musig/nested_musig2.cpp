#include "nmusig/musig/nested_musig2.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "nmusig/crypto/random.hpp"
#include "nmusig/crypto/transcript.hpp"

namespace nmusig {
namespace {

constexpr char kKeyAggDomain[] = "/keyagg";
constexpr char kNonceExtDomain[] = "/nonce-ext";
constexpr char kNonceDomain[] = "/nonce";
constexpr char kChallengeDomain[] = "/challenge";

std::vector<ECPoint> SortedKeys(std::span<const ECPoint> keys) {
  std::vector<ECPoint> sorted(keys.begin(), keys.end());
  std::sort(sorted.begin(), sorted.end());
  return sorted;
}

void AppendNonces(const Round1Output& output, Transcript* transcript) {
  transcript->append_u32_be("nu", static_cast<uint32_t>(output.nonces.size()));
  for (const ECPoint& nonce : output.nonces) {
    transcript->append_point("R", nonce);
  }
}

// sum_j coeff^j * points[j]
ECPoint FoldNonces(const std::vector<ECPoint>& points, const Scalar& coeff) {
  const std::vector<Scalar> powers = coeff.Powers(points.size());
  std::vector<ECPoint> terms;
  terms.reserve(points.size());
  for (size_t j = 0; j < points.size(); ++j) {
    terms.push_back(j == 0 ? points[j] : points[j].Mul(powers[j]));
  }
  return ECPoint::Sum(terms);
}

void RequireNonceCount(const Round1Output& output, size_t expected, const char* what) {
  if (output.nonces.size() != expected) {
    throw std::invalid_argument(std::string(what) + " has " +
                                std::to_string(output.nonces.size()) + " nonces, expected " +
                                std::to_string(expected));
  }
}

}  // namespace

NestedMusig2::NestedMusig2(NestedMusig2Params params) : params_(std::move(params)) {
  if (params_.domain.empty()) {
    throw std::invalid_argument("NestedMusig2 domain must not be empty");
  }
}

const NestedMusig2Params& NestedMusig2::params() const {
  return params_;
}

Scalar NestedMusig2::KeyAggCoefficient(std::span<const ECPoint> sorted_keys,
                                       const ECPoint& key) const {
  Transcript transcript(params_.domain + kKeyAggDomain);
  transcript.append_u32_be("n", static_cast<uint32_t>(sorted_keys.size()));
  for (const ECPoint& member : sorted_keys) {
    transcript.append_point("L", member);
  }
  transcript.append_point("X", key);
  const Scalar coefficient = transcript.challenge_scalar_mod_q();
  if (coefficient.IsZero()) {
    throw std::runtime_error("key aggregation coefficient is zero");
  }
  return coefficient;
}

ECPoint NestedMusig2::KeyAggregate(std::span<const ECPoint> keys) const {
  if (keys.empty()) {
    throw std::invalid_argument("key aggregation needs at least one key");
  }

  const std::vector<ECPoint> sorted = SortedKeys(keys);
  std::vector<ECPoint> terms;
  terms.reserve(sorted.size());
  for (const ECPoint& key : sorted) {
    terms.push_back(key.Mul(KeyAggCoefficient(sorted, key)));
  }
  return ECPoint::Sum(terms);
}

ECPoint NestedMusig2::KeyCombine(const ECPoint& lhs, const ECPoint& rhs) const {
  const ECPoint pair[2] = {lhs, rhs};
  return KeyAggregate(pair);
}

Round1Commitment NestedMusig2::Round1Begin(uint32_t participant_count) const {
  if (participant_count == 0) {
    throw std::invalid_argument("round 1 needs at least one nonce");
  }

  Round1Commitment out;
  out.state.nonces.reserve(participant_count);
  out.output.nonces.reserve(participant_count);
  for (uint32_t j = 0; j < participant_count; ++j) {
    Scalar nonce = Csprng::RandomNonZeroScalar();
    out.output.nonces.push_back(ECPoint::GeneratorMultiply(nonce));
    out.state.nonces.push_back(std::move(nonce));
  }
  return out;
}

Round1Output NestedMusig2::Round1Aggregate(std::span<const Round1Output> outputs) const {
  if (outputs.empty()) {
    throw std::invalid_argument("round 1 aggregation needs at least one output");
  }

  const size_t nu = outputs.front().nonces.size();
  if (nu == 0) {
    throw std::invalid_argument("round 1 output carries no nonces");
  }
  for (const Round1Output& output : outputs) {
    RequireNonceCount(output, nu, "round 1 output");
  }

  Round1Output aggregate;
  aggregate.nonces.reserve(nu);
  std::vector<ECPoint> column;
  column.reserve(outputs.size());
  for (size_t j = 0; j < nu; ++j) {
    column.clear();
    for (const Round1Output& output : outputs) {
      column.push_back(output.nonces[j]);
    }
    aggregate.nonces.push_back(ECPoint::Sum(column));
  }
  return aggregate;
}

Round1Output NestedMusig2::Round1Extend(const Round1Output& aggregate,
                                        const ECPoint& tweak_key) const {
  if (aggregate.nonces.empty()) {
    throw std::invalid_argument("cannot extend an empty round 1 aggregate");
  }

  const std::vector<Scalar> powers =
      ExtensionCoefficient(tweak_key, aggregate).Powers(aggregate.nonces.size());
  Round1Output extended;
  extended.nonces.reserve(aggregate.nonces.size());
  for (size_t j = 0; j < aggregate.nonces.size(); ++j) {
    extended.nonces.push_back(j == 0 ? aggregate.nonces[j] : aggregate.nonces[j].Mul(powers[j]));
  }
  return extended;
}

Round2Share NestedMusig2::Round2Sign(const Round1State& state,
                                     std::span<const Round1Output> outer_context,
                                     const Scalar& secret_key,
                                     std::span<const uint8_t> message,
                                     const AuthPath& auth_path) const {
  const size_t nu = state.nonces.size();
  if (nu == 0) {
    throw std::invalid_argument("round 2 needs round 1 nonces");
  }
  if (outer_context.size() != auth_path.size()) {
    throw std::invalid_argument("outer context and authentication path differ in depth");
  }

  const ECPoint own_key = ECPoint::GeneratorMultiply(secret_key);
  const size_t depth = auth_path.size();

  // Walk from the leaf to the root, recovering each ancestor's key and the
  // product of this leaf's key coefficients along the way.
  std::vector<ECPoint> ancestor_keys(depth);
  Scalar key_coefficient = Scalar::One();
  ECPoint current = own_key;
  for (size_t level = depth; level-- > 0;) {
    const std::vector<ECPoint>& siblings = auth_path[level];
    if (siblings.empty()) {
      throw std::invalid_argument("authentication path level has no siblings");
    }

    std::vector<ECPoint> members = siblings;
    members.push_back(current);
    std::sort(members.begin(), members.end());
    key_coefficient *= KeyAggCoefficient(members, current);
    current = KeyAggregate(members);
    ancestor_keys[level] = current;
  }
  const ECPoint& root_key = current;

  Round1Output root_aggregate;
  if (depth == 0) {
    for (const Scalar& nonce : state.nonces) {
      root_aggregate.nonces.push_back(ECPoint::GeneratorMultiply(nonce));
    }
  } else {
    for (const Round1Output& output : outer_context) {
      RequireNonceCount(output, nu, "outer context entry");
    }
    root_aggregate = outer_context.front();
  }

  const Scalar b0 = NonceCoefficient(root_key, root_aggregate, message);
  Scalar beta = b0;
  for (size_t level = 1; level < depth; ++level) {
    beta *= ExtensionCoefficient(ancestor_keys[level], outer_context[level]);
  }

  const ECPoint nonce_point = FoldNonces(root_aggregate.nonces, b0);
  const Scalar c = Challenge(root_key, nonce_point, message);

  const std::vector<Scalar> beta_powers = beta.Powers(nu);
  Scalar s = c * key_coefficient * secret_key;
  for (size_t j = 0; j < nu; ++j) {
    s += beta_powers[j] * state.nonces[j];
  }
  return Round2Share{nonce_point, s};
}

Round2Share NestedMusig2::Round2Aggregate(std::span<const Round2Share> parts) const {
  if (parts.empty()) {
    throw std::invalid_argument("round 2 aggregation needs at least one share");
  }

  Round2Share out{parts.front().state, Scalar()};
  for (const Round2Share& part : parts) {
    out.output += part.output;
  }
  return out;
}

bool NestedMusig2::Verify(const ECPoint& aggregate_key,
                          std::span<const uint8_t> message,
                          const SchnorrSignature& signature) const {
  if (signature.output.IsZero()) {
    return false;
  }

  try {
    const Scalar c = Challenge(aggregate_key, signature.state, message);
    const ECPoint lhs = ECPoint::GeneratorMultiply(signature.output);
    const ECPoint rhs = signature.state.Add(aggregate_key.Mul(c));
    return lhs == rhs;
  } catch (const std::invalid_argument&) {
    // Off-curve inputs or an intermediate point at infinity.
    return false;
  }
}

Scalar NestedMusig2::ExtensionCoefficient(const ECPoint& node_key,
                                          const Round1Output& aggregate) const {
  Transcript transcript(params_.domain + kNonceExtDomain);
  transcript.append_point("X", node_key);
  AppendNonces(aggregate, &transcript);
  return transcript.challenge_scalar_mod_q();
}

Scalar NestedMusig2::NonceCoefficient(const ECPoint& root_key,
                                      const Round1Output& aggregate,
                                      std::span<const uint8_t> message) const {
  Transcript transcript(params_.domain + kNonceDomain);
  transcript.append_point("X", root_key);
  AppendNonces(aggregate, &transcript);
  transcript.append("m", message);
  return transcript.challenge_scalar_mod_q();
}

Scalar NestedMusig2::Challenge(const ECPoint& root_key,
                               const ECPoint& nonce_point,
                               std::span<const uint8_t> message) const {
  Transcript transcript(params_.domain + kChallengeDomain);
  transcript.append_point("X", root_key);
  transcript.append_point("R", nonce_point);
  transcript.append("m", message);
  return transcript.challenge_scalar_mod_q();
}

KeyPair GenerateKeyPair() {
  KeyPair pair;
  pair.secret_key = Csprng::RandomNonZeroScalar();
  pair.public_key = ECPoint::GeneratorMultiply(pair.secret_key);
  return pair;
}

}  // namespace nmusig
