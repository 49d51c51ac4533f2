#include "grpc_error.hpp"

#include <string>

namespace lending::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace lending::util;

  const auto* lending_error = dynamic_cast<const LendingError*>(&e);
  if (!lending_error) {
    return {::grpc::StatusCode::INTERNAL, e.what()};
  }

  const std::string message = std::string(ReasonName(lending_error->Reason())) + ": " + e.what();

  if (dynamic_cast<const Unauthorized*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, message};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, message};
  }
  if (dynamic_cast<const StateConflict*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, message};
  }
  if (dynamic_cast<const InvalidValue*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, message};
  }
  if (dynamic_cast<const ResourceExhausted*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, message};
  }

  return {::grpc::StatusCode::INTERNAL, message};
}

} // namespace lending::grpc
