#pragma once

#include <exception>
#include <string_view>

namespace rtask::service {

/*
  Converts internal exceptions into the error codes reported to clients.
*/

enum class ErrorCode {
  kNotFound,
  kInvalidArgument,
  kFailedPrecondition,
  kResourceExhausted,
  kInternal,
};

ErrorCode ToErrorCode(const std::exception& e);

std::string_view ErrorCodeName(ErrorCode code);

} // namespace rtask::service
