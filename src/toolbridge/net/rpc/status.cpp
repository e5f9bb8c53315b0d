#include "status.hpp"

namespace toolbridge::net {

const char* str(StatusCode code) {
  switch (code) {
  case StatusCode::OK: return "OK";
  case StatusCode::CANCELLED: return "CANCELLED";
  case StatusCode::UNKNOWN: return "UNKNOWN";
  case StatusCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
  case StatusCode::DEADLINE_EXCEEDED: return "DEADLINE_EXCEEDED";
  case StatusCode::NOT_FOUND: return "NOT_FOUND";
  case StatusCode::ALREADY_EXISTS: return "ALREADY_EXISTS";
  case StatusCode::PERMISSION_DENIED: return "PERMISSION_DENIED";
  case StatusCode::UNAUTHENTICATED: return "UNAUTHENTICATED";
  case StatusCode::RESOURCE_EXHAUSTED: return "RESOURCE_EXHAUSTED";
  case StatusCode::FAILED_PRECONDITION: return "FAILED_PRECONDITION";
  case StatusCode::ABORTED: return "ABORTED";
  case StatusCode::OUT_OF_RANGE: return "OUT_OF_RANGE";
  case StatusCode::UNIMPLEMENTED: return "UNIMPLEMENTED";
  case StatusCode::INTERNAL: return "INTERNAL";
  case StatusCode::UNAVAILABLE: return "UNAVAILABLE";
  case StatusCode::DATA_LOSS: return "DATA_LOSS";
  case StatusCode::NOT_READY: return "NOT_READY";
  case StatusCode::CONNECTION_LOST: return "CONNECTION_LOST";
  case StatusCode::REMOTE_ERROR: return "REMOTE_ERROR";
  case StatusCode::DO_NOT_USE: return "DO_NOT_USE";
  }
  return "<unknown status code>";
}

std::string Status::to_string() const {
  std::string out{str(status_code_)};
  if (!error_message_.empty()) {
    out += ": ";
    out += error_message_;
  }
  if (!error_details_.empty()) {
    out += " (";
    out += error_details_;
    out += ")";
  }
  return out;
}

} // namespace toolbridge::net
