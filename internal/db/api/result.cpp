#include "internal/db/api/result.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace cms::db {

std::string_view ToString(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not found";
    case ErrorCode::AlreadyExists: return "already exists";
    case ErrorCode::ConstraintViolation: return "constraint violation";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::IOError: return "i/o error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InternalError: return "internal error";
  }
  return "unknown";
}

void ThrowIfError(const Result& result, const std::string& what) {
  if (result) return;

  std::string detail = what + " failed (" + std::string(ToString(result.code)) + ")";
  if (!result.message.empty()) detail += ": " + result.message;

  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(detail);
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw util::InvalidState(detail);
    default:
      throw std::runtime_error(detail);
  }
}

} // namespace cms::db
