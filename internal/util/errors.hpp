#pragma once

#include <stdexcept>
#include <string>

namespace relay::util {

/*
  Central error types.

  These get translated later to gRPC status codes. Errors raised while
  a stream is live are reported as error events instead (see
  stream::StreamOrchestrator).
*/

class CapacityExceeded : public std::runtime_error {
 public:
  explicit CapacityExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConnectionNotFound : public std::runtime_error {
 public:
  explicit ConnectionNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UpstreamGenerationError : public std::runtime_error {
 public:
  explicit UpstreamGenerationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class FlushFailure : public std::runtime_error {
 public:
  explicit FlushFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DecryptionError : public std::runtime_error {
 public:
  explicit DecryptionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CompressionFailure : public std::runtime_error {
 public:
  explicit CompressionFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Machine-readable code carried by error events.
const char* ErrorCode(const std::exception& e);

} // namespace relay::util
