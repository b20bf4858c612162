#pragma once
#include <stdexcept>
#include <string>

namespace vindex {

enum class ErrorCode {
  NotFound,
  InvalidArgument,
  DimensionMismatch,
  CapacityExceeded,
  PayloadTooLarge,
  UnsupportedMedia,
  StorageIO,
  InferenceFailed,
  GateExhausted,
  GateMisconfigured,
  Internal
};

// Stable wire name, e.g. "NOT_FOUND".
const char* code_name(ErrorCode code);
int http_status(ErrorCode code);

class Error : public std::runtime_error {
public:
  Error(ErrorCode code, const std::string& message, std::string detail = {})
    : std::runtime_error(message), code_(code), detail_(std::move(detail)) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& detail() const noexcept { return detail_; }

private:
  ErrorCode code_;
  std::string detail_;
};

} // namespace vindex
