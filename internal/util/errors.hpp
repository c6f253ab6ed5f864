#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace goalgraph::util {

/*
  Central error types.

  Structural violations (cycle, self dependency, locked) are raised before any
  write. External failures are raised after the call returned and before the
  graph is touched.
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

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CycleError : public std::runtime_error {
 public:
  explicit CycleError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SelfDependencyError : public std::runtime_error {
 public:
  explicit SelfDependencyError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LockedError : public std::runtime_error {
 public:
  explicit LockedError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StepLimitExceeded : public std::runtime_error {
 public:
  StepLimitExceeded(const std::string& msg, std::size_t limit) : std::runtime_error(msg), limit_(limit) {
  }

  std::size_t limit() const {
    return limit_;
  }

 private:
  std::size_t limit_;
};

// Skipped and reported in step results while advancing; thrown when a roadmap
// is seeded with colliding titles.
class DuplicateStepTitle : public std::runtime_error {
 public:
  DuplicateStepTitle(const std::string& msg, std::string title) : std::runtime_error(msg), title_(std::move(title)) {
  }

  const std::string& title() const {
    return title_;
  }

 private:
  std::string title_;
};

class ExternalServiceFailure : public std::runtime_error {
 public:
  ExternalServiceFailure(const std::string& msg, bool recoverable) : std::runtime_error(msg), recoverable_(recoverable) {
  }

  bool recoverable() const {
    return recoverable_;
  }

 private:
  bool recoverable_;
};

class PartialActivationFailure : public std::runtime_error {
 public:
  PartialActivationFailure(const std::string& msg, std::vector<std::string> created_event_ids)
      : std::runtime_error(msg), created_event_ids_(std::move(created_event_ids)) {
  }

  const std::vector<std::string>& created_event_ids() const {
    return created_event_ids_;
  }

 private:
  std::vector<std::string> created_event_ids_;
};

class InvalidBreakdown : public std::runtime_error {
 public:
  explicit InvalidBreakdown(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace goalgraph::util
