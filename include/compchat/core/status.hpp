// include/compchat/core/status.hpp
#pragma once

#include <optional>
#include <string>
#include <utility>

namespace compchat {

class Status {
 public:
  enum class Code : int {
    kOk = 0,

    // Caller errors
    kInvalidArgument,
    kOutOfRange,  // also: end of a pull sequence ("eof")

    // Environment / IO
    kNotFound,
    kIoError,

    // Data / parsing
    kParseError,

    // Query taxonomy
    kDatasetUnavailable,
    kUnsupportedVariant,
    kReasoningFailure,
    kExecutionTimeout,
    kChannelClosed,

    // System / unexpected
    kInternal,
  };

  Status() = default;  // OK
  Status(Code code, std::string message)
      : code_(code), message_(std::move(message)) {}

  [[nodiscard]] bool ok() const noexcept { return code_ == Code::kOk; }
  [[nodiscard]] Code code() const noexcept { return code_; }
  [[nodiscard]] const std::string& message() const noexcept { return message_; }

  // End of a pull sequence. A wait that merely ran out of time is
  // out_of_range("timeout") and is not eof.
  [[nodiscard]] bool is_eof() const noexcept { return code_ == Code::kOutOfRange && message_ == "eof"; }
  [[nodiscard]] bool is_timeout() const noexcept { return code_ == Code::kOutOfRange && message_ == "timeout"; }

  static Status ok_status() { return Status(); }
  static Status eof() { return Status(Code::kOutOfRange, "eof"); }
  static Status timeout() { return Status(Code::kOutOfRange, "timeout"); }

  static Status invalid_argument(std::string msg) { return Status(Code::kInvalidArgument, std::move(msg)); }
  static Status out_of_range(std::string msg) { return Status(Code::kOutOfRange, std::move(msg)); }
  static Status not_found(std::string msg) { return Status(Code::kNotFound, std::move(msg)); }
  static Status io_error(std::string msg) { return Status(Code::kIoError, std::move(msg)); }
  static Status parse_error(std::string msg) { return Status(Code::kParseError, std::move(msg)); }
  static Status dataset_unavailable(std::string msg) { return Status(Code::kDatasetUnavailable, std::move(msg)); }
  static Status unsupported_variant(std::string msg) { return Status(Code::kUnsupportedVariant, std::move(msg)); }
  static Status reasoning_failure(std::string msg) { return Status(Code::kReasoningFailure, std::move(msg)); }
  static Status execution_timeout(std::string msg) { return Status(Code::kExecutionTimeout, std::move(msg)); }
  static Status channel_closed(std::string msg) { return Status(Code::kChannelClosed, std::move(msg)); }
  static Status internal(std::string msg) { return Status(Code::kInternal, std::move(msg)); }

 private:
  Code code_ = Code::kOk;
  std::string message_;
};

// Stable names, used by the journal and the CLI.
const char* status_code_name(Status::Code code) noexcept;

// "<CODE>: <message>"
std::string to_string(const Status& s);

template <typename T>
class Result {
 public:
  Result() = delete;

  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(Status status) { return Result(std::move(status)); }

  [[nodiscard]] bool ok() const noexcept { return status_.ok(); }
  [[nodiscard]] const Status& status() const noexcept { return status_; }

  [[nodiscard]] const T* value_if_ok() const noexcept { return ok() ? &(*value_) : nullptr; }
  [[nodiscard]] T* value_if_ok() noexcept { return ok() ? &(*value_) : nullptr; }

  [[nodiscard]] const T& value() const { return value_.value(); }
  [[nodiscard]] T& value() { return value_.value(); }

  [[nodiscard]] const T& operator*() const { return value(); }
  [[nodiscard]] T& operator*() { return value(); }

  [[nodiscard]] const T* operator->() const { return &value(); }
  [[nodiscard]] T* operator->() { return &value(); }

  [[nodiscard]] T take_value() { return std::move(value_.value()); }

 private:
  explicit Result(T value) : value_(std::move(value)), status_(Status::ok_status()) {}
  explicit Result(Status status) : value_(std::nullopt), status_(std::move(status)) {}

  std::optional<T> value_;
  Status status_;
};

#define COMPCHAT_RETURN_IF_ERROR(expr)      \
  do {                                      \
    const ::compchat::Status _s = (expr);   \
    if (!_s.ok()) return _s;                \
  } while (0)

}  // namespace compchat
