// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace ipc {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and per-component loggers
 * ("default", "api", "provider", "rpc", "cli").
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
   * @param log_to_file If true, log to a rotating file instead of stdout
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "ipc.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "provider", "rpc")
   *
   * Auto-initializes if not initialized. Unknown components fall back
   * to the default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   */
  static void SetComponentLevel(const std::string &component,
                                const std::string &level);
};

} // namespace util
} // namespace ipc

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  ipc::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  ipc::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  ipc::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  ipc::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  ipc::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_API_DEBUG(...)                                                     \
  ipc::util::LogManager::GetLogger("api")->debug(__VA_ARGS__)
#define LOG_API_WARN(...)                                                      \
  ipc::util::LogManager::GetLogger("api")->warn(__VA_ARGS__)

#define LOG_PROVIDER_TRACE(...)                                                \
  ipc::util::LogManager::GetLogger("provider")->trace(__VA_ARGS__)
#define LOG_PROVIDER_DEBUG(...)                                                \
  ipc::util::LogManager::GetLogger("provider")->debug(__VA_ARGS__)
#define LOG_PROVIDER_INFO(...)                                                 \
  ipc::util::LogManager::GetLogger("provider")->info(__VA_ARGS__)
#define LOG_PROVIDER_WARN(...)                                                 \
  ipc::util::LogManager::GetLogger("provider")->warn(__VA_ARGS__)
#define LOG_PROVIDER_ERROR(...)                                                \
  ipc::util::LogManager::GetLogger("provider")->error(__VA_ARGS__)

#define LOG_RPC_TRACE(...)                                                     \
  ipc::util::LogManager::GetLogger("rpc")->trace(__VA_ARGS__)
#define LOG_RPC_DEBUG(...)                                                     \
  ipc::util::LogManager::GetLogger("rpc")->debug(__VA_ARGS__)
#define LOG_RPC_WARN(...)                                                      \
  ipc::util::LogManager::GetLogger("rpc")->warn(__VA_ARGS__)
#define LOG_RPC_ERROR(...)                                                     \
  ipc::util::LogManager::GetLogger("rpc")->error(__VA_ARGS__)

#define LOG_CLI_INFO(...)                                                      \
  ipc::util::LogManager::GetLogger("cli")->info(__VA_ARGS__)
#define LOG_CLI_ERROR(...)                                                     \
  ipc::util::LogManager::GetLogger("cli")->error(__VA_ARGS__)
