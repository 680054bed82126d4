#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace longform::util {

/*
  Central error types.

  Every failure that crosses the pipeline boundary carries one of these
  kinds. They get translated later to gRPC status codes.
*/

enum class ErrorKind {
  kInvalidInput,
  kNotFound,
  kRecipeNotFound,
  kTranscriptNotFound,
  kRenderNotFound,
  kTranscriptionFailed,
  kRenderSubmissionFailed,
  kExecutionError,
  kRenderTimeout,
  kConflict,
  kInternal,
};

constexpr std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidInput:
      return "InvalidInput";
    case ErrorKind::kNotFound:
      return "NotFound";
    case ErrorKind::kRecipeNotFound:
      return "RecipeNotFound";
    case ErrorKind::kTranscriptNotFound:
      return "TranscriptNotFound";
    case ErrorKind::kRenderNotFound:
      return "RenderNotFound";
    case ErrorKind::kTranscriptionFailed:
      return "TranscriptionFailed";
    case ErrorKind::kRenderSubmissionFailed:
      return "RenderSubmissionFailed";
    case ErrorKind::kExecutionError:
      return "ExecutionError";
    case ErrorKind::kRenderTimeout:
      return "RenderTimeout";
    case ErrorKind::kConflict:
      return "Conflict";
    case ErrorKind::kInternal:
      break;
  }
  return "Internal";
}

class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind Kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

class InvalidInput : public Error {
 public:
  explicit InvalidInput(const std::string& msg) : Error(ErrorKind::kInvalidInput, msg) {
  }
};

class NotFound : public Error {
 public:
  explicit NotFound(const std::string& msg, ErrorKind kind = ErrorKind::kNotFound) : Error(kind, msg) {
  }
};

class RecipeNotFound : public NotFound {
 public:
  explicit RecipeNotFound(const std::string& msg) : NotFound(msg, ErrorKind::kRecipeNotFound) {
  }
};

class TranscriptNotFound : public NotFound {
 public:
  explicit TranscriptNotFound(const std::string& msg) : NotFound(msg, ErrorKind::kTranscriptNotFound) {
  }
};

class RenderNotFound : public NotFound {
 public:
  explicit RenderNotFound(const std::string& msg) : NotFound(msg, ErrorKind::kRenderNotFound) {
  }
};

class TranscriptionFailed : public Error {
 public:
  explicit TranscriptionFailed(const std::string& msg) : Error(ErrorKind::kTranscriptionFailed, msg) {
  }
};

class RenderSubmissionFailed : public Error {
 public:
  explicit RenderSubmissionFailed(const std::string& msg) : Error(ErrorKind::kRenderSubmissionFailed, msg) {
  }
};

class ExecutionError : public Error {
 public:
  explicit ExecutionError(const std::string& msg) : Error(ErrorKind::kExecutionError, msg) {
  }
};

class RenderTimeout : public Error {
 public:
  explicit RenderTimeout(const std::string& msg) : Error(ErrorKind::kRenderTimeout, msg) {
  }
};

// Storage level write conflict (duplicate version, stale row version).
class Conflict : public Error {
 public:
  explicit Conflict(const std::string& msg) : Error(ErrorKind::kConflict, msg) {
  }
};

/*
  Collaborator errors.

  Raised by transcription / render provider adapters only. The pipeline
  maps them onto the kinds above before anything reaches a caller.
*/

class CollaboratorError : public std::runtime_error {
 public:
  CollaboratorError(const std::string& code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  const std::string& Code() const noexcept {
    return code_;
  }

 private:
  std::string code_;
};

class CollaboratorTimeout : public CollaboratorError {
 public:
  explicit CollaboratorTimeout(const std::string& msg) : CollaboratorError("timeout", msg) {
  }
};

inline ErrorKind KindOf(const std::exception& e) {
  if (const auto* error = dynamic_cast<const Error*>(&e)) {
    return error->Kind();
  }
  return ErrorKind::kInternal;
}

} // namespace longform::util
