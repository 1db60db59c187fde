// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dispatch/type_info.hpp"
#include "dispatch/value.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace courier {
namespace dispatch {

enum class ResultStatus {
  Ok,
  Created,
  NoContent,
  BadRequest,
  Invalid,
  NotFound,
  Unauthorized,
  Forbidden,
  Conflict,
  Error,
  CriticalError,
  Unavailable,
};

const char *ResultStatusName(ResultStatus status);

enum class ValidationSeverity { Error, Warning, Info };

struct ValidationError {
  std::string identifier;
  std::string message;
  std::string error_code;
  ValidationSeverity severity = ValidationSeverity::Error;
};

/**
 * Result<> - outcome of an operation without a payload
 *
 * Handlers and middleware return results instead of throwing for expected
 * failures (validation, missing records). Result<T> adds a payload and
 * converts implicitly from a Result<>, so a handler declared to return
 * Result<Order> can `return Result<>::NotFound("...")`.
 */
template <> class Result<void> {
public:
  Result() = default;
  virtual ~Result() = default;

  ResultStatus status() const { return status_; }
  // Ok, Created or NoContent
  bool IsSuccess() const {
    return status_ == ResultStatus::Ok || status_ == ResultStatus::Created ||
           status_ == ResultStatus::NoContent;
  }
  const std::string &message() const { return message_; }
  const std::string &location() const { return location_; }
  const std::vector<ValidationError> &validation_errors() const { return validation_errors_; }

  static Result Success(std::string message = {});
  static Result Created(std::string location = {});
  static Result NoContent();
  static Result BadRequest(std::string message = {});
  static Result Invalid(std::vector<ValidationError> errors);
  static Result Invalid(ValidationError error);
  static Result NotFound(std::string message = {});
  static Result Unauthorized(std::string message = {});
  static Result Forbidden(std::string message = {});
  static Result Conflict(std::string message = {});
  static Result Error(std::string message = {});
  static Result CriticalError(std::string message = {});
  static Result Unavailable(std::string message = {});

  static const ResultHooks *CourierResultHooks();

protected:
  Result(ResultStatus status, std::string message)
      : status_(status), message_(std::move(message)) {}

  ResultStatus status_ = ResultStatus::Ok;
  std::string message_;
  std::string location_;
  std::vector<ValidationError> validation_errors_;
};

template <typename T> class Result : public Result<void> {
public:
  using BaseTypes = TypeList<Result<void>>;

  // Success carrying value
  Result(T value) : value_(std::move(value)) {}
  // Copies status, message and validation errors; no payload
  Result(const Result<void> &other) : Result<void>(other) {}

  static Result Success(T value) { return Result(std::move(value)); }
  static Result Created(T value, std::string location = {}) {
    Result result(std::move(value));
    result.status_ = ResultStatus::Created;
    result.location_ = std::move(location);
    return result;
  }

  bool HasValue() const { return value_.has_value(); }

  // @throws std::logic_error when the result carries no value
  const T &value() const {
    if (!value_) {
      throw std::logic_error(std::string("Result has no value (status ") +
                             ResultStatusName(status_) + ")");
    }
    return *value_;
  }

  static const ResultHooks *CourierResultHooks();

private:
  std::optional<T> value_;
};

template <typename T> const ResultHooks *Result<T>::CourierResultHooks() {
  static const ResultHooks hooks{
      [](const void *object) -> const Result<void> & {
        return *static_cast<const Result<T> *>(object);
      },
      [](const std::shared_ptr<const void> &object) -> Value {
        auto typed = std::static_pointer_cast<const Result<T>>(object);
        if (!typed->IsSuccess() || !typed->HasValue()) {
          return Value();
        }
        return Value::FromShared(std::shared_ptr<const void>(typed, &typed->value()),
                                 TypeInfo::Get<T>());
      },
      [](const Result<void> &source) -> std::shared_ptr<const void> {
        return std::make_shared<const Result<T>>(source);
      },
      &TypeInfo::Get<T>,
  };
  return &hooks;
}

} // namespace dispatch
} // namespace courier
