#pragma once

#include <string>

#include "nmusig/common/bytes.hpp"

namespace nmusig {

enum class SessionStatus {
  kRunning = 0,
  kCompleted = 1,
  kAborted = 2,
};

const char* SessionStatusName(SessionStatus status);

class Session {
 public:
  explicit Session(Bytes session_id);
  virtual ~Session() = default;

  const Bytes& session_id() const;
  std::string session_tag() const;

  SessionStatus status() const;
  bool IsTerminal() const;
  const std::string& abort_reason() const;

 protected:
  void Abort(const std::string& reason);
  void Complete();

 private:
  Bytes session_id_;

  SessionStatus status_ = SessionStatus::kRunning;
  std::string abort_reason_;
};

}  // namespace nmusig
