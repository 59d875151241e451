#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace pageforge::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace pageforge::grpc
