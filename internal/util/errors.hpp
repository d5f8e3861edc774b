#pragma once

#include <stdexcept>
#include <string>

namespace cms::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Addressing error: no configured shard for a service name / index.
class UnknownService : public std::runtime_error {
 public:
  explicit UnknownService(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Connection refused/reset/deadline. Never retried by the core.
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AuthorizationDenied : public std::runtime_error {
 public:
  explicit AuthorizationDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

// One part of a multi-part upload failed; nothing was committed.
class PartialUploadFailure : public std::runtime_error {
 public:
  explicit PartialUploadFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Protocol errors raised by the upload join coordinator.
class UnexpectedTag : public std::logic_error {
 public:
  explicit UnexpectedTag(const std::string& msg) : std::logic_error(msg) {
  }
};

class InvalidSession : public std::logic_error {
 public:
  explicit InvalidSession(const std::string& msg) : std::logic_error(msg) {
  }
};

} // namespace cms::util
