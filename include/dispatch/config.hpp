// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace courier {
namespace dispatch {

enum class PublishStrategy {
  Sequential, // one handler after the other, ascending order
  Parallel,   // handlers started in order, run concurrently on the worker pool
};

// "sequential" / "parallel"; nullopt otherwise
std::optional<PublishStrategy> ParsePublishStrategy(const std::string &name);
const char *PublishStrategyName(PublishStrategy strategy);

struct MediatorConfig {
  PublishStrategy publish_strategy = PublishStrategy::Parallel;
  // 0 = hardware concurrency
  size_t worker_threads = 0;
  // 0 = unbounded
  size_t max_queue_size = 0;
  std::string log_level = "info";
  // Log every registration at startup
  bool log_registrations = false;
};

/**
 * Read a MediatorConfig from JSON
 *
 * Recognized keys (all optional):
 *   { "publish_strategy": "parallel", "worker_threads": 4,
 *     "max_queue_size": 0, "log_level": "info", "log_registrations": false }
 *
 * Unknown keys are ignored. Returns nullopt on malformed values, with the
 * reason in *error when given.
 */
std::optional<MediatorConfig> ParseMediatorConfig(const nlohmann::json &j,
                                                  std::string *error = nullptr);

// Load from a JSON file; nullopt when missing or malformed
std::optional<MediatorConfig> LoadMediatorConfig(const std::string &path,
                                                 std::string *error = nullptr);

nlohmann::json MediatorConfigToJson(const MediatorConfig &config);

} // namespace dispatch
} // namespace courier
