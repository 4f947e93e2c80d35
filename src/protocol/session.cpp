#include "nmusig/protocol/session.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace nmusig {
namespace {

constexpr size_t kSessionTagBytes = 8;

}  // namespace

const char* SessionStatusName(SessionStatus status) {
  switch (status) {
    case SessionStatus::kRunning:
      return "running";
    case SessionStatus::kCompleted:
      return "completed";
    case SessionStatus::kAborted:
      return "aborted";
  }
  return "unknown";
}

Session::Session(Bytes session_id) : session_id_(std::move(session_id)) {
  if (session_id_.empty()) {
    throw std::invalid_argument("Session ID must not be empty");
  }
}

const Bytes& Session::session_id() const {
  return session_id_;
}

// Short hex prefix of the session id for log lines.
std::string Session::session_tag() const {
  const size_t len = std::min(session_id_.size(), kSessionTagBytes);
  return ToHex(std::span<const uint8_t>(session_id_.data(), len));
}

SessionStatus Session::status() const {
  return status_;
}

bool Session::IsTerminal() const {
  return status_ == SessionStatus::kCompleted || status_ == SessionStatus::kAborted;
}

const std::string& Session::abort_reason() const {
  return abort_reason_;
}

void Session::Abort(const std::string& reason) {
  if (IsTerminal()) {
    return;
  }
  status_ = SessionStatus::kAborted;
  abort_reason_ = reason;
}

void Session::Complete() {
  if (IsTerminal()) {
    return;
  }
  status_ = SessionStatus::kCompleted;
  abort_reason_.clear();
}

}  // namespace nmusig
