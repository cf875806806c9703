// File: include/solar/core/status.hpp
#pragma once

#include <optional>
#include <string>
#include <utility>

namespace solar {

// Error value returned across module boundaries. Exceptions stay inside the
// module that caught them (yaml-cpp, std::thread, sensor adapters).
class Status {
 public:
  enum class Code : int {
    kOk = 0,

    // Bad configuration or caller input; fix the YAML and retry.
    kInvalidArgument,
    kOutOfRange,
    kParseError,
    kNotFound,

    // Called in the wrong lifecycle state (not started, already running).
    kFailedPrecondition,

    // Sensors and files.
    kIoError,
    kUnavailable,
    kUnsupported,

    kInternal,
  };

  Status() = default;
  Status(Code code, std::string message) : code_(code), message_(std::move(message)) {}

  [[nodiscard]] bool ok() const noexcept { return code_ == Code::kOk; }
  [[nodiscard]] Code code() const noexcept { return code_; }
  [[nodiscard]] const std::string& message() const noexcept { return message_; }

  static Status ok_status() { return {}; }

  static Status invalid_argument(std::string m) { return {Code::kInvalidArgument, std::move(m)}; }
  static Status out_of_range(std::string m) { return {Code::kOutOfRange, std::move(m)}; }
  static Status parse_error(std::string m) { return {Code::kParseError, std::move(m)}; }
  static Status not_found(std::string m) { return {Code::kNotFound, std::move(m)}; }
  static Status failed_precondition(std::string m) { return {Code::kFailedPrecondition, std::move(m)}; }
  static Status io_error(std::string m) { return {Code::kIoError, std::move(m)}; }
  static Status unavailable(std::string m) { return {Code::kUnavailable, std::move(m)}; }
  static Status unsupported(std::string m) { return {Code::kUnsupported, std::move(m)}; }
  static Status internal(std::string m) { return {Code::kInternal, std::move(m)}; }

 private:
  Code code_ = Code::kOk;
  std::string message_;
};

// Lower-case code name used in event messages ("invalid_argument").
const char* to_string(Status::Code code) noexcept;

// Either a value or a non-OK Status. value() on an error throws
// std::bad_optional_access; check ok() first.
template <typename T>
class Result {
 public:
  Result() = delete;

  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(Status status) { return Result(std::move(status)); }

  [[nodiscard]] bool ok() const noexcept { return status_.ok(); }
  [[nodiscard]] const Status& status() const noexcept { return status_; }

  [[nodiscard]] const T& value() const { return value_.value(); }
  [[nodiscard]] T& value() { return value_.value(); }
  [[nodiscard]] T take_value() { return std::move(value_.value()); }

  const T& operator*() const { return value(); }
  T& operator*() { return value(); }
  const T* operator->() const { return &value(); }
  T* operator->() { return &value(); }

 private:
  explicit Result(T value) : value_(std::move(value)) {}
  explicit Result(Status status) : status_(std::move(status)) {}

  std::optional<T> value_;
  Status status_;
};

#define SOLAR_RETURN_IF_ERROR(expr)            \
  do {                                         \
    const ::solar::Status solar_st_ = (expr);  \
    if (!solar_st_.ok()) return solar_st_;     \
  } while (0)

}  // namespace solar
