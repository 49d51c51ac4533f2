#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace lending::grpc {

/*
  Converts internal exceptions into gRPC status codes. The error reason name
  prefixes the message so clients can branch on it.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace lending::grpc
