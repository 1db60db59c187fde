// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dispatch/errors.hpp"

namespace courier {
namespace dispatch {

namespace {

std::string JoinNames(const std::vector<std::string> &names) {
  std::string joined;
  for (const auto &name : names) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += name;
  }
  return joined;
}

std::string DescribeAll(const std::vector<std::exception_ptr> &errors) {
  std::string joined;
  for (const auto &error : errors) {
    if (!joined.empty()) {
      joined += "; ";
    }
    joined += DescribeException(error);
  }
  return joined;
}

} // namespace

HandlerNotFoundError::HandlerNotFoundError(const std::string &message_type)
    : DispatchError("No handler registered for message type " + message_type),
      message_type_(message_type) {}

AmbiguousHandlerError::AmbiguousHandlerError(const std::string &message_type,
                                             std::vector<std::string> handlers)
    : DispatchError("Multiple handlers registered for message type " + message_type +
                    ": " + JoinNames(handlers)),
      message_type_(message_type), handlers_(std::move(handlers)) {}

ConstructionError::ConstructionError(const std::string &component,
                                     const std::string &reason,
                                     std::exception_ptr cause)
    : DispatchError("Unable to construct " + component + ": " + reason),
      component_(component), cause_(std::move(cause)) {}

SyncPipelineViolationError::SyncPipelineViolationError(const std::string &message_type,
                                                       const std::string &participant)
    : DispatchError("Synchronous dispatch of " + message_type +
                    " reached asynchronous participant " + participant +
                    "; use InvokeAsync or PublishAsync"),
      participant_(participant) {}

AggregatedHandlerErrors::AggregatedHandlerErrors(const std::string &message_type,
                                                 std::vector<std::exception_ptr> errors)
    : DispatchError(std::to_string(errors.size()) + " handlers failed for " +
                    message_type + ": " + DescribeAll(errors)),
      errors_(std::move(errors)) {}

std::string DescribeException(const std::exception_ptr &error) {
  if (!error) {
    return "no exception";
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

} // namespace dispatch
} // namespace courier
