#include "error_code.hpp"

#include "internal/util/errors.hpp"

namespace rtask::service {

ErrorCode ToErrorCode(const std::exception& e) {
  using namespace rtask::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return ErrorCode::kNotFound;
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return ErrorCode::kInvalidArgument;
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return ErrorCode::kFailedPrecondition;
  }
  if (dynamic_cast<const ResourceExhausted*>(&e)) {
    return ErrorCode::kResourceExhausted;
  }

  return ErrorCode::kInternal;
}

std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNotFound:
      return "not_found";
    case ErrorCode::kInvalidArgument:
      return "invalid_argument";
    case ErrorCode::kFailedPrecondition:
      return "failed_precondition";
    case ErrorCode::kResourceExhausted:
      return "resource_exhausted";
    case ErrorCode::kInternal:
      break;
  }
  return "internal";
}

} // namespace rtask::service
