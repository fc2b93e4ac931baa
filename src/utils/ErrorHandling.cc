#include "oddity/utils/ErrorHandling.hh"
#include "oddity/core/Log.hh"

namespace oddity {

OddityException::OddityException(std::string message)
    : message_(std::move(message)) {}

const char *OddityException::what() const noexcept {
  return message_.c_str();
}

void throwError(const std::string &message) {
  ODDITY_LOG_ERROR("{}", message);
  throw OddityException(message);
}

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "Ok";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::ParseError:
    return "ParseError";
  case ErrorCode::TypeMismatch:
    return "TypeMismatch";
  case ErrorCode::OutOfRange:
    return "OutOfRange";
  case ErrorCode::MalformedState:
    return "MalformedState";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  }
  return "Unknown";
}

} // namespace oddity
