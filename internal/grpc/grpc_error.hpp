#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace narrative::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace narrative::grpc
