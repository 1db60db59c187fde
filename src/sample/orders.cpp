// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sample/orders.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace courier {
namespace sample {

using dispatch::CallContext;
using dispatch::HandlerResult;
using dispatch::Result;
using dispatch::Value;

Order OrderRepository::Add(const std::string &customer, const std::string &sku, int quantity) {
  std::lock_guard<std::mutex> lock(mutex_);
  Order order{next_id_++, customer, sku, quantity};
  orders_[order.id] = order;
  return order;
}

std::optional<Order> OrderRepository::Find(int id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t OrderRepository::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return orders_.size();
}

void AuditLog::Record(std::string entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back(std::move(entry));
}

std::vector<std::string> AuditLog::Entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

size_t AuditLog::Count(const std::string &entry) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(std::count(entries_.begin(), entries_.end(), entry));
}

void InventoryService::Reserve(const std::string &sku, int quantity) {
  attempts_.fetch_add(1);
  if (failures_left_.fetch_sub(1) > 0) {
    throw TransientError("inventory unavailable for " + sku);
  }
  LOG_APP_INFO("Reserved {} x {}", quantity, sku);
}

std::string PingHandler::Handle(const Ping &ping) const { return "Pong: " + ping.text; }

std::tuple<Result<Order>, std::optional<OrderCreated>>
OrderHandler::Handle(const CreateOrder &cmd) {
  inventory_->Reserve(cmd.sku, cmd.quantity);
  Order order = orders_->Add(cmd.customer, cmd.sku, cmd.quantity);
  LOG_APP_INFO("Created order {} for {}", order.id, order.customer);
  return {Result<Order>::Created(order, "/orders/" + std::to_string(order.id)),
          OrderCreated(order.id, order.customer)};
}

std::future<Result<Order>> GetOrderHandler::Handle(const GetOrder &query, CallContext &ctx) {
  ctx.ThrowIfCancellationRequested();
  auto orders = orders_;
  int id = query.id;
  return std::async(std::launch::async, [orders, id]() -> Result<Order> {
    auto order = orders->Find(id);
    if (!order) {
      return Result<>::NotFound("order " + std::to_string(id) + " does not exist");
    }
    return *order;
  });
}

void OrderEmailHandler::Handle(const OrderCreated &event) {
  log_->Record("email:" + std::to_string(event.order_id()));
}

void OrderAuditHandler::Handle(const OrderEvent &event) {
  log_->Record("audit:" + std::to_string(event.order_id()));
}

TimingMiddleware::Clock::time_point TimingMiddleware::Before(const Value &message,
                                                             CallContext &ctx) {
  LOG_APP_INFO("-> {} ({})", message.TypeName(), ctx.handler().name);
  return Clock::now();
}

void TimingMiddleware::Finally(const Value &message, CallContext &ctx) {
  const Clock::time_point *started = ctx.State<Clock::time_point>();
  auto elapsed = started ? std::chrono::duration_cast<std::chrono::microseconds>(
                               Clock::now() - *started)
                         : std::chrono::microseconds(0);
  if (ctx.exception()) {
    LOG_APP_WARN("<- {} failed after {}us: {}", message.TypeName(), elapsed.count(),
                 dispatch::DescribeException(ctx.exception()));
  } else {
    LOG_APP_INFO("<- {} {} in {}us", message.TypeName(),
                 ctx.short_circuited() ? "short-circuited" : "completed", elapsed.count());
  }
}

HandlerResult CreateOrderValidation::Before(const CreateOrder &cmd, CallContext &) {
  std::vector<dispatch::ValidationError> errors;
  if (cmd.customer.empty()) {
    errors.push_back({"customer", "customer is required", "required"});
  }
  if (cmd.sku.empty()) {
    errors.push_back({"sku", "sku is required", "required"});
  }
  if (cmd.quantity <= 0) {
    errors.push_back({"quantity", "quantity must be positive", "range"});
  }
  if (!errors.empty()) {
    return HandlerResult::ShortCircuit(Result<>::Invalid(std::move(errors)));
  }
  return HandlerResult::Continue();
}

Value RetryMiddleware::Execute(const Value &message, CallContext &ctx,
                               const dispatch::Next &next) {
  for (int attempt = 1;; ++attempt) {
    try {
      return next();
    } catch (const TransientError &e) {
      if (attempt >= kMaxAttempts) {
        throw;
      }
      ctx.ThrowIfCancellationRequested();
      LOG_APP_WARN("{} attempt {} failed ({}), retrying", message.TypeName(), attempt, e.what());
    }
  }
}

void AddOrderServices(dispatch::ServiceProvider &services, int inventory_failures) {
  services.AddSingleton<OrderRepository>(std::make_shared<OrderRepository>());
  services.AddSingleton<AuditLog>(std::make_shared<AuditLog>());
  services.AddSingleton<InventoryService>(std::make_shared<InventoryService>(inventory_failures));
  services.AddScoped<GetOrderHandler>([](dispatch::Scope &scope) {
    return std::make_shared<GetOrderHandler>(dispatch::RequireService<OrderRepository>(scope));
  });
}

void AddOrderHandlers(dispatch::HandlerRegistry::Builder &builder) {
  using dispatch::HandlerOptions;
  using dispatch::Lifetime;
  using dispatch::MiddlewareOptions;

  builder.AddHandler(&PingHandler::Handle);

  HandlerOptions create;
  create.factory = [](dispatch::Scope &scope) -> std::shared_ptr<void> {
    return std::make_shared<OrderHandler>(dispatch::RequireService<OrderRepository>(scope),
                                          dispatch::RequireService<InventoryService>(scope));
  };
  create.UseMiddleware<RetryMiddleware>();
  builder.AddHandler(&OrderHandler::Handle, std::move(create));

  HandlerOptions get;
  get.lifetime = Lifetime::Scoped;
  builder.AddHandler(&GetOrderHandler::Handle, std::move(get));

  HandlerOptions email;
  email.order = 1;
  email.factory = [](dispatch::Scope &scope) -> std::shared_ptr<void> {
    return std::make_shared<OrderEmailHandler>(dispatch::RequireService<AuditLog>(scope));
  };
  builder.AddHandler(&OrderEmailHandler::Handle, std::move(email));

  HandlerOptions audit;
  audit.order = 2;
  audit.factory = [](dispatch::Scope &scope) -> std::shared_ptr<void> {
    return std::make_shared<OrderAuditHandler>(dispatch::RequireService<AuditLog>(scope));
  };
  builder.AddHandler(&OrderAuditHandler::Handle, std::move(audit));

  MiddlewareOptions timing;
  timing.order = 0;
  builder.AddMiddleware<TimingMiddleware>(std::move(timing));
  builder.AddMiddleware<CreateOrderValidation, CreateOrder>();

  MiddlewareOptions retry;
  retry.explicit_only = true;
  retry.order = -1;
  builder.AddMiddleware<RetryMiddleware>(std::move(retry));
}

} // namespace sample
} // namespace courier
