#pragma once

#include <stdexcept>
#include <string>

namespace labbook::util {

/*
  Central error types.

  Verification failures (NotCachedError, StaleDependencyError, CorruptCacheError)
  are raised before anything is mutated. WorkExecutionError is raised after the
  stage's lock record has been restored.
*/

class NotCachedError : public std::runtime_error {
 public:
  NotCachedError(const std::string& stage, const std::string& msg) : std::runtime_error(msg), stage_(stage) {
  }

  const std::string& stage() const {
    return stage_;
  }

 private:
  std::string stage_;
};

class StaleDependencyError : public std::runtime_error {
 public:
  StaleDependencyError(const std::string& stage, const std::string& dependency, const std::string& recorded, const std::string& live,
                       const std::string& msg)
      : std::runtime_error(msg), stage_(stage), dependency_(dependency), recorded_(recorded), live_(live) {
  }

  const std::string& stage() const {
    return stage_;
  }
  const std::string& dependency() const {
    return dependency_;
  }
  // Hex signature stored in the stage's lock record; empty if the key was missing.
  const std::string& recorded() const {
    return recorded_;
  }
  const std::string& live() const {
    return live_;
  }

 private:
  std::string stage_;
  std::string dependency_;
  std::string recorded_;
  std::string live_;
};

class CorruptCacheError : public std::runtime_error {
 public:
  CorruptCacheError(const std::string& stage, const std::string& msg) : std::runtime_error(msg), stage_(stage) {
  }

  const std::string& stage() const {
    return stage_;
  }

 private:
  std::string stage_;
};

class IOError : public std::runtime_error {
 public:
  explicit IOError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class WorkExecutionError : public std::runtime_error {
 public:
  explicit WorkExecutionError(const std::string& msg, int exit_code = -1) : std::runtime_error(msg), exit_code_(exit_code) {
  }

  int exit_code() const {
    return exit_code_;
  }

 private:
  int exit_code_;
};

class StageCancelled : public std::runtime_error {
 public:
  explicit StageCancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace labbook::util
