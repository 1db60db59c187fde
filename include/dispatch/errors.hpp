// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace courier {
namespace dispatch {

// Base of every error raised by the dispatch runtime itself. Exceptions thrown
// by handlers and middleware propagate unchanged and are not wrapped.
class DispatchError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Invoke found no handler for the message type
class HandlerNotFoundError : public DispatchError {
public:
  explicit HandlerNotFoundError(const std::string &message_type);
  const std::string &message_type() const { return message_type_; }

private:
  std::string message_type_;
};

// Invoke found more than one handler for the message type
class AmbiguousHandlerError : public DispatchError {
public:
  AmbiguousHandlerError(const std::string &message_type,
                        std::vector<std::string> handlers);
  const std::string &message_type() const { return message_type_; }
  const std::vector<std::string> &handlers() const { return handlers_; }

private:
  std::string message_type_;
  std::vector<std::string> handlers_;
};

// A handler or middleware instance could not be obtained
class ConstructionError : public DispatchError {
public:
  ConstructionError(const std::string &component, const std::string &reason,
                    std::exception_ptr cause = nullptr);
  const std::string &component() const { return component_; }
  // Underlying factory failure, if any
  const std::exception_ptr &cause() const { return cause_; }

private:
  std::string component_;
  std::exception_ptr cause_;
};

// Synchronous dispatch met a pipeline with an asynchronous participant
class SyncPipelineViolationError : public DispatchError {
public:
  SyncPipelineViolationError(const std::string &message_type,
                             const std::string &participant);
  const std::string &participant() const { return participant_; }

private:
  std::string participant_;
};

// Handler output cannot satisfy the requested response type
class ResponseTypeMismatchError : public DispatchError {
public:
  using DispatchError::DispatchError;
};

class CancellationError : public DispatchError {
public:
  CancellationError() : DispatchError("Operation was cancelled") {}
  using DispatchError::DispatchError;
};

// Two or more publish handlers failed; carries every failure in handler order
class AggregatedHandlerErrors : public DispatchError {
public:
  AggregatedHandlerErrors(const std::string &message_type,
                          std::vector<std::exception_ptr> errors);
  const std::vector<std::exception_ptr> &errors() const { return errors_; }
  size_t size() const { return errors_.size(); }

private:
  std::vector<std::exception_ptr> errors_;
};

// what() of the stored exception, or "unknown exception"
std::string DescribeException(const std::exception_ptr &error);

} // namespace dispatch
} // namespace courier
