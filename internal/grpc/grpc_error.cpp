#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace narrative::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace narrative::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const ValidationError*>(&e) || dynamic_cast<const SelfReferenceError*>(&e) ||
      dynamic_cast<const InvalidParentReference*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const DepthViolation*>(&e) || dynamic_cast<const AlreadyParented*>(&e) || dynamic_cast<const InvalidTransition*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const ConcurrentModification*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace narrative::grpc
