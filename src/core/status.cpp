// File: src/core/status.cpp
#include "compchat/core/status.hpp"

namespace compchat {

const char* status_code_name(Status::Code code) noexcept {
  switch (code) {
    case Status::Code::kOk: return "OK";
    case Status::Code::kInvalidArgument: return "INVALID_ARGUMENT";
    case Status::Code::kOutOfRange: return "OUT_OF_RANGE";
    case Status::Code::kNotFound: return "NOT_FOUND";
    case Status::Code::kIoError: return "IO_ERROR";
    case Status::Code::kParseError: return "PARSE_ERROR";
    case Status::Code::kDatasetUnavailable: return "DATASET_UNAVAILABLE";
    case Status::Code::kUnsupportedVariant: return "UNSUPPORTED_VARIANT";
    case Status::Code::kReasoningFailure: return "REASONING_FAILURE";
    case Status::Code::kExecutionTimeout: return "EXECUTION_TIMEOUT";
    case Status::Code::kChannelClosed: return "CHANNEL_CLOSED";
    case Status::Code::kInternal: return "INTERNAL";
  }
  return "UNKNOWN";
}

std::string to_string(const Status& s) {
  if (s.ok()) return "OK";
  return std::string(status_code_name(s.code())) + ": " + s.message();
}

}  // namespace compchat
