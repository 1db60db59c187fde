// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dispatch/result.hpp"

namespace courier {
namespace dispatch {

const char *ResultStatusName(ResultStatus status) {
  switch (status) {
  case ResultStatus::Ok:
    return "Ok";
  case ResultStatus::Created:
    return "Created";
  case ResultStatus::NoContent:
    return "NoContent";
  case ResultStatus::BadRequest:
    return "BadRequest";
  case ResultStatus::Invalid:
    return "Invalid";
  case ResultStatus::NotFound:
    return "NotFound";
  case ResultStatus::Unauthorized:
    return "Unauthorized";
  case ResultStatus::Forbidden:
    return "Forbidden";
  case ResultStatus::Conflict:
    return "Conflict";
  case ResultStatus::Error:
    return "Error";
  case ResultStatus::CriticalError:
    return "CriticalError";
  case ResultStatus::Unavailable:
    return "Unavailable";
  }
  return "Unknown";
}

Result<void> Result<void>::Success(std::string message) {
  return Result(ResultStatus::Ok, std::move(message));
}

Result<void> Result<void>::Created(std::string location) {
  Result result(ResultStatus::Created, {});
  result.location_ = std::move(location);
  return result;
}

Result<void> Result<void>::NoContent() { return Result(ResultStatus::NoContent, {}); }

Result<void> Result<void>::BadRequest(std::string message) {
  return Result(ResultStatus::BadRequest, std::move(message));
}

Result<void> Result<void>::Invalid(std::vector<ValidationError> errors) {
  Result result(ResultStatus::Invalid, {});
  if (!errors.empty()) {
    result.message_ = errors.front().message;
  }
  result.validation_errors_ = std::move(errors);
  return result;
}

Result<void> Result<void>::Invalid(ValidationError error) {
  return Invalid(std::vector<ValidationError>{std::move(error)});
}

Result<void> Result<void>::NotFound(std::string message) {
  return Result(ResultStatus::NotFound, std::move(message));
}

Result<void> Result<void>::Unauthorized(std::string message) {
  return Result(ResultStatus::Unauthorized, std::move(message));
}

Result<void> Result<void>::Forbidden(std::string message) {
  return Result(ResultStatus::Forbidden, std::move(message));
}

Result<void> Result<void>::Conflict(std::string message) {
  return Result(ResultStatus::Conflict, std::move(message));
}

Result<void> Result<void>::Error(std::string message) {
  return Result(ResultStatus::Error, std::move(message));
}

Result<void> Result<void>::CriticalError(std::string message) {
  return Result(ResultStatus::CriticalError, std::move(message));
}

Result<void> Result<void>::Unavailable(std::string message) {
  return Result(ResultStatus::Unavailable, std::move(message));
}

const ResultHooks *Result<void>::CourierResultHooks() {
  static const ResultHooks hooks{
      [](const void *object) -> const Result<void> & {
        return *static_cast<const Result<void> *>(object);
      },
      [](const std::shared_ptr<const void> &) -> Value { return Value(); },
      nullptr,
      nullptr,
  };
  return &hooks;
}

} // namespace dispatch
} // namespace courier
