#pragma once

#include <stdexcept>
#include <string>

namespace narrative::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
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

// Malformed input: empty titles, priority outside [1,5], unknown status names.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Hierarchy violations raised by NarrativeStore::SetParent.
*/

class SelfReferenceError : public std::runtime_error {
 public:
  explicit SelfReferenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DepthViolation : public std::runtime_error {
 public:
  explicit DepthViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidParentReference : public std::runtime_error {
 public:
  explicit InvalidParentReference(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyParented : public std::runtime_error {
 public:
  explicit AlreadyParented(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidTransition : public std::runtime_error {
 public:
  explicit InvalidTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A concurrent writer changed the same row first; the caller may retry.
class ConcurrentModification : public std::runtime_error {
 public:
  explicit ConcurrentModification(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace narrative::util
