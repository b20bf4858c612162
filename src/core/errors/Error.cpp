#include "Error.hpp"

namespace vindex {

const char* code_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::NotFound:          return "NOT_FOUND";
    case ErrorCode::InvalidArgument:   return "INVALID_ARGUMENT";
    case ErrorCode::DimensionMismatch: return "DIMENSION_MISMATCH";
    case ErrorCode::CapacityExceeded:  return "CAPACITY_EXCEEDED";
    case ErrorCode::PayloadTooLarge:   return "FILE_TOO_LARGE";
    case ErrorCode::UnsupportedMedia:  return "INVALID_IMAGE";
    case ErrorCode::StorageIO:         return "STORAGE_IO";
    case ErrorCode::InferenceFailed:   return "INFERENCE_FAILED";
    case ErrorCode::GateExhausted:     return "GATE_EXHAUSTED";
    case ErrorCode::GateMisconfigured: return "GATE_MISCONFIGURED";
    case ErrorCode::Internal:          return "INTERNAL";
  }
  return "INTERNAL";
}

int http_status(ErrorCode code) {
  switch (code) {
    case ErrorCode::NotFound:          return 404;
    case ErrorCode::InvalidArgument:   return 400;
    case ErrorCode::DimensionMismatch: return 500;
    case ErrorCode::CapacityExceeded:  return 507;
    case ErrorCode::PayloadTooLarge:   return 413;
    case ErrorCode::UnsupportedMedia:  return 400;
    case ErrorCode::StorageIO:         return 500;
    case ErrorCode::InferenceFailed:   return 500;
    case ErrorCode::GateExhausted:     return 503;
    case ErrorCode::GateMisconfigured: return 500;
    case ErrorCode::Internal:          return 500;
  }
  return 500;
}

} // namespace vindex
