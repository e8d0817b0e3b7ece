// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace bridgescout {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the library and the CLI.
 *
 * Thread-safety: All methods are thread-safe. Initialization and logger
 * lookup are protected by a mutex.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical)
   * @param log_to_file If true, log to file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Multiple calls are safe; only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "bridgescout.log");

  /**
   * Shutdown logging system (flushes buffers)
   *
   * Subsequent logging calls after shutdown will auto-reinitialize.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name ("discovery", "http", "app")
   *
   * Auto-initializes if not initialized. Unknown names map to "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @return false if the component is unknown
   */
  static bool SetComponentLevel(const std::string &component,
                                const std::string &level);
};

} // namespace util
} // namespace bridgescout

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  bridgescout::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  bridgescout::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  bridgescout::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  bridgescout::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  bridgescout::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_DISC_TRACE(...)                                                    \
  bridgescout::util::LogManager::GetLogger("discovery")->trace(__VA_ARGS__)
#define LOG_DISC_DEBUG(...)                                                    \
  bridgescout::util::LogManager::GetLogger("discovery")->debug(__VA_ARGS__)
#define LOG_DISC_INFO(...)                                                     \
  bridgescout::util::LogManager::GetLogger("discovery")->info(__VA_ARGS__)
#define LOG_DISC_WARN(...)                                                     \
  bridgescout::util::LogManager::GetLogger("discovery")->warn(__VA_ARGS__)
#define LOG_DISC_ERROR(...)                                                    \
  bridgescout::util::LogManager::GetLogger("discovery")->error(__VA_ARGS__)

#define LOG_HTTP_TRACE(...)                                                    \
  bridgescout::util::LogManager::GetLogger("http")->trace(__VA_ARGS__)
#define LOG_HTTP_DEBUG(...)                                                    \
  bridgescout::util::LogManager::GetLogger("http")->debug(__VA_ARGS__)
#define LOG_HTTP_WARN(...)                                                     \
  bridgescout::util::LogManager::GetLogger("http")->warn(__VA_ARGS__)

#define LOG_APP_DEBUG(...)                                                     \
  bridgescout::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...)                                                      \
  bridgescout::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  bridgescout::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
