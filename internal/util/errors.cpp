#include "errors.hpp"

namespace relay::util {

const char* ErrorCode(const std::exception& e) {
  if (dynamic_cast<const CapacityExceeded*>(&e)) {
    return "CapacityExceeded";
  }
  if (dynamic_cast<const ConnectionNotFound*>(&e)) {
    return "ConnectionNotFound";
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return "InvalidState";
  }
  if (dynamic_cast<const UpstreamGenerationError*>(&e)) {
    return "UpstreamGenerationError";
  }
  if (dynamic_cast<const FlushFailure*>(&e)) {
    return "FlushFailure";
  }
  if (dynamic_cast<const DecryptionError*>(&e)) {
    return "DecryptionError";
  }
  if (dynamic_cast<const CompressionFailure*>(&e)) {
    return "CompressionFailure";
  }
  return "InternalError";
}

} // namespace relay::util
