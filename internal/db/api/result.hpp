#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace cms::db {

/*
  Outcome of a repository write.

  Memory and SQLite backends report the same code for the same mistake
  (duplicate testcase number, testcase for a missing task, update of a
  missing row), so callers never see backend error types.
*/
enum class ErrorCode {
  OK = 0,
  NotFound,
  AlreadyExists,
  ConstraintViolation,
  Busy,
  IOError,
  Corruption,
  InternalError,
};

std::string_view ToString(ErrorCode code) noexcept;

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

// NotFound -> util::NotFound, AlreadyExists / ConstraintViolation ->
// util::InvalidState, anything else -> std::runtime_error.
void ThrowIfError(const Result& result, const std::string& what);

} // namespace cms::db
