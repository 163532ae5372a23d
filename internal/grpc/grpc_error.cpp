#include "grpc_error.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace archive::grpc {

std::string_view ErrorKindName(const std::exception& e) {
  using namespace archive::util;

  if (dynamic_cast<const NotFound*>(&e)) return "missing-record";
  if (dynamic_cast<const OwnershipViolation*>(&e)) return "ownership-violation";
  if (dynamic_cast<const InvalidName*>(&e)) return "invalid-name";
  if (dynamic_cast<const InvalidSize*>(&e)) return "invalid-size";
  if (dynamic_cast<const MalformedLabel*>(&e)) return "malformed-label";
  if (dynamic_cast<const InvalidArgument*>(&e)) return "invalid-argument";
  if (dynamic_cast<const AlreadyExists*>(&e)) return "duplicate-entry";
  if (dynamic_cast<const AccessRestricted*>(&e)) return "access-restriction";
  if (dynamic_cast<const ViewLimited*>(&e)) return "view-limitation";
  return "internal";
}

::grpc::Status ToStatus(const std::exception& e) {
  using namespace archive::util;

  const std::string kind(ErrorKindName(e));

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what(), kind};
  }
  if (dynamic_cast<const OwnershipViolation*>(&e) || dynamic_cast<const AccessRestricted*>(&e) ||
      dynamic_cast<const ViewLimited*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what(), kind};
  }
  if (dynamic_cast<const ValidationError*>(&e) || dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what(), kind};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what(), kind};
  }

  return {::grpc::StatusCode::INTERNAL, e.what(), kind};
}

} // namespace archive::grpc
