#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace cms::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

// Asynchronous completions carry an exception_ptr; nullptr means OK.
::grpc::Status ToStatus(const std::exception_ptr& error);

} // namespace cms::grpc
