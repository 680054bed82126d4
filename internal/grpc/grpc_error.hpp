#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace longform::grpc {

/*
  Converts pipeline exceptions into gRPC status codes. The error kind name
  travels in the status details. Storage conflicts and anything that is not
  a util::Error are logged and become INTERNAL with a generic message.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace longform::grpc
