#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace pageforge::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace pageforge::util;

  if (dynamic_cast<const ValidationFailure*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const RemoteFailure*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const IOFailure*>(&e)) {
    return {::grpc::StatusCode::INTERNAL, e.what()};
  }

  return {::grpc::StatusCode::UNKNOWN, e.what()};
}

} // namespace pageforge::grpc
