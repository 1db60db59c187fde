// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace courier {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to per-component loggers throughout the dispatch library.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, also log to file
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Thread-safe: Uses std::call_once internally. Multiple calls are safe;
   * only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "courier.log");

  /**
   * Shutdown logging system (flushes buffers)
   *
   * Subsequent logging calls after shutdown will auto-reinitialize a
   * silent console logger.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "dispatch", "pipeline", "publish")
   *
   * Auto-initializes if not initialized. Unknown components get the
   * default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (dispatch, pipeline, registry, publish, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical, off)
   * @return false if the component is unknown or logging is not initialized
   */
  static bool SetComponentLevel(const std::string &component, const std::string &level);

  // Names of all component loggers created by Initialize()
  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace courier

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  courier::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  courier::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  courier::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  courier::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  courier::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_DISPATCH_TRACE(...)                                                \
  courier::util::LogManager::GetLogger("dispatch")->trace(__VA_ARGS__)
#define LOG_DISPATCH_DEBUG(...)                                                \
  courier::util::LogManager::GetLogger("dispatch")->debug(__VA_ARGS__)
#define LOG_DISPATCH_INFO(...)                                                 \
  courier::util::LogManager::GetLogger("dispatch")->info(__VA_ARGS__)
#define LOG_DISPATCH_WARN(...)                                                 \
  courier::util::LogManager::GetLogger("dispatch")->warn(__VA_ARGS__)
#define LOG_DISPATCH_ERROR(...)                                                \
  courier::util::LogManager::GetLogger("dispatch")->error(__VA_ARGS__)

#define LOG_PIPELINE_TRACE(...)                                                \
  courier::util::LogManager::GetLogger("pipeline")->trace(__VA_ARGS__)
#define LOG_PIPELINE_DEBUG(...)                                                \
  courier::util::LogManager::GetLogger("pipeline")->debug(__VA_ARGS__)
#define LOG_PIPELINE_WARN(...)                                                 \
  courier::util::LogManager::GetLogger("pipeline")->warn(__VA_ARGS__)
#define LOG_PIPELINE_ERROR(...)                                                \
  courier::util::LogManager::GetLogger("pipeline")->error(__VA_ARGS__)

#define LOG_REGISTRY_DEBUG(...)                                                \
  courier::util::LogManager::GetLogger("registry")->debug(__VA_ARGS__)
#define LOG_REGISTRY_INFO(...)                                                 \
  courier::util::LogManager::GetLogger("registry")->info(__VA_ARGS__)
#define LOG_REGISTRY_WARN(...)                                                 \
  courier::util::LogManager::GetLogger("registry")->warn(__VA_ARGS__)

#define LOG_PUBLISH_DEBUG(...)                                                 \
  courier::util::LogManager::GetLogger("publish")->debug(__VA_ARGS__)
#define LOG_PUBLISH_WARN(...)                                                  \
  courier::util::LogManager::GetLogger("publish")->warn(__VA_ARGS__)
#define LOG_PUBLISH_ERROR(...)                                                 \
  courier::util::LogManager::GetLogger("publish")->error(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  courier::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  courier::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  courier::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
