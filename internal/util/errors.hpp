#pragma once

#include <stdexcept>
#include <string>

namespace turnstile::util {

/*
  Central error types.

  Only setup and lookup faults are exceptions. Transition rejections are
  values (see core::TransitionResult) and never show up here.
*/

// Raised while wiring kinds, transitions and guards. Fatal to startup.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

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

} // namespace turnstile::util
