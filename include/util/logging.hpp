// Copyright (c) 2025 The procrouter developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace procrouter {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and access to the
 * per-component loggers ("default", "router", "host").
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex.
 */
class LogManager {
public:
  // Initialize logging system with the specified minimum log level.
  // Only the first call performs initialization.
  // Log output goes to stderr; stdout is reserved for the invocation host's responses.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "procrouter.log");

  // Flush and drop all loggers. Subsequent logging calls re-initialize with defaults.
  static void Shutdown();

  // Get logger for a component. Unknown components resolve to the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // True for names spdlog recognizes (trace, debug, info, warn, error, critical, off).
  static bool IsValidLevel(const std::string& level);

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a single component (router, host, default).
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace procrouter

#define LOG_TRACE(...) procrouter::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) procrouter::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) procrouter::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) procrouter::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) procrouter::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_ROUTER_TRACE(...) procrouter::util::LogManager::GetLogger("router")->trace(__VA_ARGS__)
#define LOG_ROUTER_DEBUG(...) procrouter::util::LogManager::GetLogger("router")->debug(__VA_ARGS__)
#define LOG_ROUTER_INFO(...) procrouter::util::LogManager::GetLogger("router")->info(__VA_ARGS__)
#define LOG_ROUTER_WARN(...) procrouter::util::LogManager::GetLogger("router")->warn(__VA_ARGS__)
#define LOG_ROUTER_ERROR(...) procrouter::util::LogManager::GetLogger("router")->error(__VA_ARGS__)

#define LOG_HOST_DEBUG(...) procrouter::util::LogManager::GetLogger("host")->debug(__VA_ARGS__)
#define LOG_HOST_INFO(...) procrouter::util::LogManager::GetLogger("host")->info(__VA_ARGS__)
#define LOG_HOST_WARN(...) procrouter::util::LogManager::GetLogger("host")->warn(__VA_ARGS__)
#define LOG_HOST_ERROR(...) procrouter::util::LogManager::GetLogger("host")->error(__VA_ARGS__)
