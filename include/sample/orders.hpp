// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dispatch/call_context.hpp"
#include "dispatch/descriptors.hpp"
#include "dispatch/handler_registry.hpp"
#include "dispatch/result.hpp"
#include "dispatch/service_scope.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

/*
 Sample order module

 A small order workflow wired through the mediator:
 - Ping -> "Pong: <text>"
 - CreateOrder -> (Result<Order>, optional OrderCreated); OrderCreated cascades
   to an email notifier and an audit handler registered for OrderEvent
 - GetOrder -> Result<Order> (asynchronous handler)
 - Middleware: timing log for every message, CreateOrder validation
   (short-circuits with Result<>::Invalid), retry around stock reservation
*/

namespace courier {
namespace sample {

struct Ping {
  std::string text;
};

struct Order {
  int id = 0;
  std::string customer;
  std::string sku;
  int quantity = 0;
};

struct CreateOrder {
  std::string customer;
  std::string sku;
  int quantity = 0;
};

struct GetOrder {
  int id = 0;
};

// Base of all order events; audit handlers subscribe here
class OrderEvent {
public:
  virtual ~OrderEvent() = default;
  virtual int order_id() const = 0;
};

class OrderCreated : public OrderEvent {
public:
  using BaseTypes = dispatch::TypeList<OrderEvent>;

  OrderCreated(int id, std::string customer) : id_(id), customer_(std::move(customer)) {}

  int order_id() const override { return id_; }
  const std::string &customer() const { return customer_; }

private:
  int id_;
  std::string customer_;
};

// Raised by InventoryService for failures worth retrying
class TransientError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class OrderRepository {
public:
  Order Add(const std::string &customer, const std::string &sku, int quantity);
  std::optional<Order> Find(int id) const;
  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<int, Order> orders_;
  int next_id_ = 1;
};

// Thread-safe record of side effects (notifications, audits)
class AuditLog {
public:
  void Record(std::string entry);
  std::vector<std::string> Entries() const;
  size_t Count(const std::string &entry) const;

private:
  mutable std::mutex mutex_;
  std::vector<std::string> entries_;
};

// Stock reservation that fails transiently for the first `failures` calls
class InventoryService {
public:
  explicit InventoryService(int failures = 0) : failures_left_(failures) {}

  // @throws TransientError while simulated failures remain
  void Reserve(const std::string &sku, int quantity);
  int attempts() const { return attempts_.load(); }

private:
  std::atomic<int> failures_left_;
  std::atomic<int> attempts_{0};
};

class PingHandler {
public:
  std::string Handle(const Ping &ping) const;
};

class OrderHandler {
public:
  OrderHandler(std::shared_ptr<OrderRepository> orders,
               std::shared_ptr<InventoryService> inventory)
      : orders_(std::move(orders)), inventory_(std::move(inventory)) {}

  std::tuple<dispatch::Result<Order>, std::optional<OrderCreated>> Handle(const CreateOrder &cmd);

private:
  std::shared_ptr<OrderRepository> orders_;
  std::shared_ptr<InventoryService> inventory_;
};

// Asynchronous lookup; resolved from the active scope on every call
class GetOrderHandler {
public:
  explicit GetOrderHandler(std::shared_ptr<OrderRepository> orders) : orders_(std::move(orders)) {}

  std::future<dispatch::Result<Order>> Handle(const GetOrder &query, dispatch::CallContext &ctx);

private:
  std::shared_ptr<OrderRepository> orders_;
};

class OrderEmailHandler {
public:
  explicit OrderEmailHandler(std::shared_ptr<AuditLog> log) : log_(std::move(log)) {}
  void Handle(const OrderCreated &event);

private:
  std::shared_ptr<AuditLog> log_;
};

class OrderAuditHandler {
public:
  explicit OrderAuditHandler(std::shared_ptr<AuditLog> log) : log_(std::move(log)) {}
  void Handle(const OrderEvent &event);

private:
  std::shared_ptr<AuditLog> log_;
};

// Logs every dispatch with its duration
class TimingMiddleware {
public:
  using Clock = std::chrono::steady_clock;

  Clock::time_point Before(const dispatch::Value &message, dispatch::CallContext &ctx);
  void Finally(const dispatch::Value &message, dispatch::CallContext &ctx);
};

class CreateOrderValidation {
public:
  dispatch::HandlerResult Before(const CreateOrder &cmd, dispatch::CallContext &ctx);
};

// Re-runs the pipeline on TransientError; applied only where requested
class RetryMiddleware {
public:
  static constexpr int kMaxAttempts = 3;

  dispatch::Value Execute(const dispatch::Value &message, dispatch::CallContext &ctx,
                          const dispatch::Next &next);
};

// Repository, audit log, inventory and the scoped GetOrderHandler
void AddOrderServices(dispatch::ServiceProvider &services, int inventory_failures = 0);

// Handlers and middleware of the order module
void AddOrderHandlers(dispatch::HandlerRegistry::Builder &builder);

} // namespace sample
} // namespace courier
