#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace tutorplane::common {

enum class ErrorKind {
  SafetyViolation,
  UnknownAction,
  InvalidArguments,
  CompilationError,
  ExecutionTimeout,
  PermissionDenied,
  NotFound,
  InternalError,
};

[[nodiscard]] std::string_view error_kind_name(ErrorKind kind);

struct Error {
  ErrorKind kind = ErrorKind::InternalError;
  std::string message;
};

class Status {
public:
  static Status success() { return Status(std::nullopt); }
  static Status error(std::string message) {
    return Status(Error{.kind = ErrorKind::InternalError, .message = std::move(message)});
  }
  static Status error(ErrorKind kind, std::string message) {
    return Status(Error{.kind = kind, .message = std::move(message)});
  }

  [[nodiscard]] bool ok() const { return !error_.has_value(); }
  [[nodiscard]] const std::string &error() const { return ok() ? empty_ : error_->message; }
  [[nodiscard]] ErrorKind error_kind() const {
    return ok() ? ErrorKind::InternalError : error_->kind;
  }
  [[nodiscard]] const std::optional<Error> &error_info() const { return error_; }

private:
  explicit Status(std::optional<Error> error) : error_(std::move(error)) {}

  std::optional<Error> error_;
  std::string empty_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(std::move(value), std::nullopt); }
  static Result failure(std::string message) {
    return Result(std::nullopt, Error{.kind = ErrorKind::InternalError, .message = std::move(message)});
  }
  static Result failure(ErrorKind kind, std::string message) {
    return Result(std::nullopt, Error{.kind = kind, .message = std::move(message)});
  }
  static Result failure(Error error) { return Result(std::nullopt, std::move(error)); }

  [[nodiscard]] bool ok() const { return value_.has_value(); }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error());
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error());
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_.message; }
  [[nodiscard]] ErrorKind error_kind() const { return error_.kind; }
  [[nodiscard]] const Error &error_info() const { return error_; }

private:
  Result(std::optional<T> value, std::optional<Error> error)
      : value_(std::move(value)), error_(error.has_value() ? std::move(*error) : Error{}) {}

  std::optional<T> value_;
  Error error_;
};

} // namespace tutorplane::common
