#include "grpc_error.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace longform::grpc {

namespace {

::grpc::StatusCode CodeFor(util::ErrorKind kind) {
  switch (kind) {
    case util::ErrorKind::kInvalidInput:
      return ::grpc::StatusCode::INVALID_ARGUMENT;
    case util::ErrorKind::kNotFound:
    case util::ErrorKind::kRecipeNotFound:
    case util::ErrorKind::kTranscriptNotFound:
    case util::ErrorKind::kRenderNotFound:
      return ::grpc::StatusCode::NOT_FOUND;
    case util::ErrorKind::kTranscriptionFailed:
    case util::ErrorKind::kRenderSubmissionFailed:
      return ::grpc::StatusCode::UNAVAILABLE;
    case util::ErrorKind::kExecutionError:
      return ::grpc::StatusCode::FAILED_PRECONDITION;
    case util::ErrorKind::kRenderTimeout:
      return ::grpc::StatusCode::DEADLINE_EXCEEDED;
    case util::ErrorKind::kConflict:
    case util::ErrorKind::kInternal:
      break;
  }
  return ::grpc::StatusCode::INTERNAL;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  if (const auto* error = dynamic_cast<const util::Error*>(&e)) {
    const auto code = CodeFor(error->Kind());
    if (code != ::grpc::StatusCode::INTERNAL) {
      return {code, e.what(), std::string(util::ErrorKindName(error->Kind()))};
    }
  }

  LONGFORM_LOG_ERROR("unhandled exception at service boundary", {observability::StringField("error", e.what())});
  return {::grpc::StatusCode::INTERNAL, "internal error", std::string(util::ErrorKindName(util::ErrorKind::kInternal))};
}

} // namespace longform::grpc
