#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace nmusig {

enum class ProtocolErrorKind {
  kEmptyInput = 1,
  kPrimitiveFailure = 2,
  kStructuralInconsistency = 3,
};

const char* ProtocolErrorKindName(ProtocolErrorKind kind);

// Fatal signing-session failure. None of these are recoverable: the session
// that raised one must be discarded.
class ProtocolError : public std::runtime_error {
 public:
  ProtocolError(ProtocolErrorKind kind, const std::string& message);

  ProtocolErrorKind kind() const;

 private:
  ProtocolErrorKind kind_;
};

// Runs one backend call, turning any standard exception it raises into a
// kPrimitiveFailure tagged with `operation`.
template <typename Fn>
auto InvokePrimitive(const char* operation, Fn&& fn) -> decltype(std::forward<Fn>(fn)()) {
  try {
    return std::forward<Fn>(fn)();
  } catch (const ProtocolError&) {
    throw;
  } catch (const std::exception& ex) {
    throw ProtocolError(ProtocolErrorKind::kPrimitiveFailure,
                        std::string(operation) + " failed: " + ex.what());
  }
}

}  // namespace nmusig
