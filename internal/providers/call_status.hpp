#pragma once

#include <grpcpp/client_context.h>
#include <grpcpp/support/status.h>

#include <chrono>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace longform::providers {

inline void SetDeadline(::grpc::ClientContext& ctx, std::chrono::milliseconds timeout) {
  if (timeout.count() > 0) {
    ctx.set_deadline(std::chrono::system_clock::now() + timeout);
  }
}

// DEADLINE_EXCEEDED becomes CollaboratorTimeout, anything else CollaboratorError.
inline void ThrowIfFailed(const ::grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return;
  }
  const std::string message = std::string(action) + " failed: " + status.error_message();
  if (status.error_code() == ::grpc::StatusCode::DEADLINE_EXCEEDED) {
    throw util::CollaboratorTimeout(message);
  }
  throw util::CollaboratorError(std::to_string(static_cast<int>(status.error_code())), message);
}

} // namespace longform::providers
