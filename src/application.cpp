// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "dispatch/errors.hpp"
#include "dispatch/result.hpp"
#include "sample/orders.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iostream>

namespace courier {
namespace app {

using dispatch::Result;
using sample::Order;

Application::Application(AppConfig config) : config_(std::move(config)) {}

Application::~Application() {
  // Mediator first: its workers may still reference services
  mediator_.reset();
  services_.reset();
}

bool Application::initialize() {
  if (!init_config()) {
    LOG_ERROR("Failed to load configuration");
    return false;
  }

  util::LogManager::SetLogLevel(mediator_config_.log_level);

  if (!config_.list_handlers) {
    std::cout << GetStartupBanner(dispatch::PublishStrategyName(mediator_config_.publish_strategy))
              << std::flush;
  }

  LOG_APP_INFO("Initializing courier...");
  try {
    init_dispatch();
  } catch (const std::exception &e) {
    LOG_APP_ERROR("Failed to initialize dispatch: {}", e.what());
    return false;
  }

  LOG_APP_INFO("Initialization complete");
  return true;
}

bool Application::init_config() {
  if (!config_.config_file.empty()) {
    std::string error;
    auto loaded = dispatch::LoadMediatorConfig(config_.config_file, &error);
    if (!loaded) {
      LOG_ERROR("Invalid configuration file {}: {}", config_.config_file, error);
      return false;
    }
    mediator_config_ = *loaded;
  }

  // Command line wins over the file
  if (config_.log_level) {
    mediator_config_.log_level = *config_.log_level;
  }
  if (config_.publish_strategy) {
    mediator_config_.publish_strategy = *config_.publish_strategy;
  }
  if (config_.worker_threads) {
    mediator_config_.worker_threads = *config_.worker_threads;
  }
  return true;
}

void Application::init_dispatch() {
  services_ = std::make_unique<dispatch::ServiceProvider>();
  sample::AddOrderServices(*services_, config_.inventory_failures);

  dispatch::HandlerRegistry::Builder builder;
  sample::AddOrderHandlers(builder);

  mediator_ = std::make_unique<dispatch::Mediator>(builder.Build(), *services_, mediator_config_);
}

int Application::run() {
  if (!mediator_) {
    LOG_APP_ERROR("Application not initialized");
    return 1;
  }
  return config_.list_handlers ? list_handlers() : run_sample();
}

int Application::list_handlers() const {
  std::cout << mediator_->registry().ToJson().dump(2) << std::endl;
  return 0;
}

int Application::run_sample() {
  try {
    auto pong = mediator_->Invoke<std::string>(sample::Ping{"courier"});
    LOG_APP_INFO("Ping answered: {}", pong);

    // Request scope for the rest of the run; scoped handlers live here
    auto scope = services_->CreateScope();

    auto created = mediator_
                       ->InvokeAsync<Result<Order>>(sample::CreateOrder{"alice", "widget", 2},
                                                    *scope)
                       .get();
    if (!created.IsSuccess()) {
      LOG_APP_ERROR("Order creation failed: {}", dispatch::ResultStatusName(created.status()));
      return 1;
    }
    LOG_APP_INFO("Order {} created at {}", created.value().id, created.location());

    auto rejected =
        mediator_->Invoke<Result<Order>>(sample::CreateOrder{"bob", "", 0}, *scope);
    LOG_APP_INFO("Invalid order rejected: {} ({} validation errors)",
                 dispatch::ResultStatusName(rejected.status()),
                 rejected.validation_errors().size());

    try {
      mediator_->Invoke<Result<Order>>(sample::GetOrder{created.value().id}, *scope);
    } catch (const dispatch::SyncPipelineViolationError &e) {
      LOG_APP_INFO("Synchronous lookup refused: {}", e.what());
    }

    auto found = mediator_
                     ->InvokeAsync<Result<Order>>(sample::GetOrder{created.value().id}, *scope)
                     .get();
    if (found.IsSuccess()) {
      LOG_APP_INFO("Order {} belongs to {}", found.value().id, found.value().customer);
    }

    auto missing = mediator_->InvokeAsync<Result<Order>>(sample::GetOrder{999}, *scope).get();
    LOG_APP_INFO("Lookup of order 999: {} ({})", dispatch::ResultStatusName(missing.status()),
                 missing.message());

    mediator_->PublishAsync(sample::OrderCreated(created.value().id, "alice"), *scope).get();

    auto log = dispatch::RequireService<sample::AuditLog>(*services_);
    for (const auto &entry : log->Entries()) {
      LOG_APP_INFO("Side effect: {}", entry);
    }
    return 0;
  } catch (const std::exception &e) {
    LOG_APP_ERROR("Sample run failed: {}", e.what());
    return 1;
  }
}

} // namespace app
} // namespace courier
