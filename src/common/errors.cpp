#include "nmusig/common/errors.hpp"

namespace nmusig {

const char* ProtocolErrorKindName(ProtocolErrorKind kind) {
  switch (kind) {
    case ProtocolErrorKind::kEmptyInput:
      return "EmptyInput";
    case ProtocolErrorKind::kPrimitiveFailure:
      return "PrimitiveFailure";
    case ProtocolErrorKind::kStructuralInconsistency:
      return "StructuralInconsistency";
  }
  return "Unknown";
}

ProtocolError::ProtocolError(ProtocolErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(ProtocolErrorKindName(kind)) + ": " + message),
      kind_(kind) {}

ProtocolErrorKind ProtocolError::kind() const {
  return kind_;
}

}  // namespace nmusig
