#pragma once

#include <exception>
#include <string_view>

#include <grpcpp/grpcpp.h>

namespace archive::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  The error kind name (e.g. "ownership-violation") is placed in the status
  error details so clients can tell validation kinds apart.
*/

::grpc::Status ToStatus(const std::exception& e);

std::string_view ErrorKindName(const std::exception& e);

} // namespace archive::grpc
