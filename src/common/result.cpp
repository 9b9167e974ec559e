#include "carryover/common/result.hpp"

namespace carryover::common {

std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::Io:
    return "io_error";
  case ErrorCode::CorruptHeader:
    return "corrupt_header";
  case ErrorCode::CorruptRecord:
    return "corrupt_record";
  case ErrorCode::HandshakeTimeout:
    return "handshake_timeout";
  case ErrorCode::HandshakeRejected:
    return "handshake_rejected";
  case ErrorCode::InvalidConfig:
    return "invalid_config";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::Cancelled:
    return "cancelled";
  case ErrorCode::ServiceError:
    return "service_error";
  }
  return "unknown";
}

} // namespace carryover::common
