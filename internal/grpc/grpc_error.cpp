#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace cms::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace cms::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const UnknownService*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const TransportError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const AuthorizationDenied*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const PartialUploadFailure*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  return {::grpc::StatusCode::INTERNAL, e.what()};
}

::grpc::Status ToStatus(const std::exception_ptr& error) {
  if (!error) {
    return ::grpc::Status::OK;
  }

  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return ToStatus(e);
  } catch (...) {
    return {::grpc::StatusCode::INTERNAL, "unknown error"};
  }
}

} // namespace cms::grpc
