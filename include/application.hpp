// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dispatch/config.hpp"
#include "dispatch/handler_registry.hpp"
#include "dispatch/mediator.hpp"
#include "dispatch/service_scope.hpp"
#include <memory>
#include <optional>
#include <string>

namespace courier {
namespace app {

// Application configuration (command line; overrides the JSON config file)
struct AppConfig {
  // Optional JSON MediatorConfig file
  std::string config_file;

  std::optional<std::string> log_level;
  std::optional<dispatch::PublishStrategy> publish_strategy;
  std::optional<size_t> worker_threads;

  // Print the registry as JSON and exit
  bool list_handlers = false;

  // Simulated inventory outages, absorbed by the retry middleware
  int inventory_failures = 1;
};

// Application - wires services, registry and mediator, then runs the sample
// order workflow
class Application {
public:
  explicit Application(AppConfig config = AppConfig{});
  ~Application();

  // Load configuration and build services, registry and mediator
  bool initialize();

  // Run the sample workflow (or the listing); returns the process exit code
  int run();

  dispatch::Mediator &mediator() { return *mediator_; }
  const dispatch::MediatorConfig &mediator_config() const { return mediator_config_; }

private:
  bool init_config();
  void init_dispatch();

  int list_handlers() const;
  int run_sample();

  AppConfig config_;
  dispatch::MediatorConfig mediator_config_;

  // Declared before the mediator, which borrows it
  std::unique_ptr<dispatch::ServiceProvider> services_;
  std::unique_ptr<dispatch::Mediator> mediator_;
};

} // namespace app
} // namespace courier
