#pragma once

#include <string>
#include <utility>

namespace longform::db {

/*
  Backend-neutral outcome of a repository write.

  sqlite and pqxx errors are mapped onto these codes inside the backend;
  core::ThrowIfDbError turns them into pipeline exceptions. Reads report
  absence through std::optional instead of NotFound.
*/

enum class ErrorCode {
  OK = 0,

  // UpdateRender on an id that was never inserted.
  NotFound,
  // Duplicate primary key on insert.
  AlreadyExists,
  // Stale row_version on UpdateRender.
  Conflict,
  // Database locked past the busy timeout.
  Busy,
  // Unique constraint, e.g. a (deliverable_id, version) collision between
  // concurrent compiles.
  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace longform::db
