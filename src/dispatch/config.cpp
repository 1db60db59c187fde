// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dispatch/config.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <fstream>

using json = nlohmann::json;

namespace courier {
namespace dispatch {

namespace {

bool Fail(std::string *error, const std::string &reason) {
  if (error) {
    *error = reason;
  }
  return false;
}

bool ReadCount(const json &j, const char *key, size_t &out, std::string *error) {
  if (!j.contains(key)) {
    return true;
  }
  const json &value = j.at(key);
  if (!value.is_number_integer() || value.get<long long>() < 0) {
    return Fail(error, std::string(key) + " must be a non-negative integer");
  }
  out = value.get<size_t>();
  return true;
}

} // namespace

std::optional<PublishStrategy> ParsePublishStrategy(const std::string &name) {
  if (name == "sequential") {
    return PublishStrategy::Sequential;
  }
  if (name == "parallel") {
    return PublishStrategy::Parallel;
  }
  return std::nullopt;
}

const char *PublishStrategyName(PublishStrategy strategy) {
  switch (strategy) {
  case PublishStrategy::Sequential:
    return "sequential";
  case PublishStrategy::Parallel:
    return "parallel";
  }
  return "unknown";
}

std::optional<MediatorConfig> ParseMediatorConfig(const json &j, std::string *error) {
  if (!j.is_object()) {
    Fail(error, "configuration must be a JSON object");
    return std::nullopt;
  }

  MediatorConfig config;

  if (j.contains("publish_strategy")) {
    const json &value = j.at("publish_strategy");
    auto strategy = value.is_string() ? ParsePublishStrategy(value.get<std::string>())
                                      : std::nullopt;
    if (!strategy) {
      Fail(error, "publish_strategy must be \"sequential\" or \"parallel\"");
      return std::nullopt;
    }
    config.publish_strategy = *strategy;
  }

  if (!ReadCount(j, "worker_threads", config.worker_threads, error) ||
      !ReadCount(j, "max_queue_size", config.max_queue_size, error)) {
    return std::nullopt;
  }

  if (j.contains("log_level")) {
    const json &value = j.at("log_level");
    if (!value.is_string() || !util::IsValidLogLevel(value.get<std::string>())) {
      Fail(error, "log_level must be one of trace, debug, info, warn, error, critical, off");
      return std::nullopt;
    }
    config.log_level = value.get<std::string>();
  }

  if (j.contains("log_registrations")) {
    const json &value = j.at("log_registrations");
    if (!value.is_boolean()) {
      Fail(error, "log_registrations must be a boolean");
      return std::nullopt;
    }
    config.log_registrations = value.get<bool>();
  }

  return config;
}

std::optional<MediatorConfig> LoadMediatorConfig(const std::string &path, std::string *error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    Fail(error, "cannot open " + path);
    return std::nullopt;
  }

  try {
    json j;
    file >> j;
    auto config = ParseMediatorConfig(j, error);
    if (config) {
      LOG_DEBUG("Loaded mediator configuration from {}", path);
    }
    return config;
  } catch (const json::exception &e) {
    LOG_WARN("Failed to parse configuration {}: {}", path, e.what());
    Fail(error, std::string("invalid JSON: ") + e.what());
    return std::nullopt;
  }
}

json MediatorConfigToJson(const MediatorConfig &config) {
  return {{"publish_strategy", PublishStrategyName(config.publish_strategy)},
          {"worker_threads", config.worker_threads},
          {"max_queue_size", config.max_queue_size},
          {"log_level", config.log_level},
          {"log_registrations", config.log_registrations}};
}

} // namespace dispatch
} // namespace courier
