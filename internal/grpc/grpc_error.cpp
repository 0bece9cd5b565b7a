#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace relay::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace relay::util;

  if (dynamic_cast<const CapacityExceeded*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (dynamic_cast<const ConnectionNotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const DecryptionError*>(&e)) {
    return {::grpc::StatusCode::DATA_LOSS, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace relay::grpc
