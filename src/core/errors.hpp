#pragma once

#include <stdexcept>
#include <string>

namespace taskstream {

// Publish/close/abort on a session that is not open. Indicates the scoped
// acquisition discipline was violated; never caught inside the library.
class SessionStateError : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

// The message sink could not durably store the final message
class PersistenceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The agent capability failed, possibly after producing chunks
class AgentError : public std::runtime_error {
 public:
  explicit AgentError(const std::string &message, bool retryable = true) : std::runtime_error(message), retryable_(retryable) {}

  bool retryable() const {
    return retryable_;
  }

 private:
  bool retryable_;
};

// An activity failed on every attempt its retry policy allowed
class ActivityError : public std::runtime_error {
 public:
  ActivityError(const std::string &activity, int attempts, const std::string &last_error)
      : std::runtime_error("Activity '" + activity + "' failed after " + std::to_string(attempts) + " attempt(s): " + last_error),
        activity_(activity),
        attempts_(attempts),
        last_error_(last_error) {}

  const std::string &activity() const {
    return activity_;
  }

  int attempts() const {
    return attempts_;
  }

  const std::string &last_error() const {
    return last_error_;
  }

 private:
  std::string activity_;
  int attempts_;
  std::string last_error_;
};

}  // namespace taskstream
