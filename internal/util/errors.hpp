#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace settlement::util {

/*
  Central error types.

  These get translated later to gRPC status codes and, at the event
  boundary, decide between inline retry, retry queue and dead letter.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Caller supplied something unusable. reason() is a stable machine code.
class ValidationError : public std::runtime_error {
 public:
  ValidationError(std::string reason, const std::string& msg) : std::runtime_error(msg), reason_(std::move(reason)) {
  }

  const std::string& reason() const {
    return reason_;
  }

 private:
  std::string reason_;
};

// Lock contention, serialization failure, unavailable store.
class Transient : public std::runtime_error {
 public:
  explicit Transient(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DeadlineExceeded : public std::runtime_error {
 public:
  explicit DeadlineExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unauthenticated : public std::runtime_error {
 public:
  explicit Unauthenticated(const std::string& msg) : std::runtime_error(msg) {
  }
};

inline bool IsRetryable(const std::exception& e) {
  return dynamic_cast<const Transient*>(&e) != nullptr || dynamic_cast<const DeadlineExceeded*>(&e) != nullptr;
}

} // namespace settlement::util
