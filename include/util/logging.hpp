// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace trustledger {
namespace util {

/**
 * Logging front-end over spdlog
 *
 * One named logger per component ("default", "chain", "index", "storage").
 * Loggers share sinks: colored stderr, plus an optional file sink.
 *
 * Thread-safety: all methods are thread-safe. The first Initialize() call
 * wins; later calls are no-ops until Shutdown().
 */
class LogManager {
public:
  // Initialize logging with the given minimum level ("trace".."off").
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "debug.log");

  // Flush and drop all loggers. Logging after shutdown re-initializes with defaults.
  static void Shutdown();

  // Logger for a component. Unknown names return the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set level of every component logger.
  static void SetLogLevel(const std::string& level);

  // Set level of a single component logger.
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace trustledger

#define LOG_TRACE(...) trustledger::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) trustledger::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) trustledger::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) trustledger::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) trustledger::util::LogManager::GetLogger()->error(__VA_ARGS__)

#define LOG_CHAIN_TRACE(...) trustledger::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...) trustledger::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...) trustledger::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...) trustledger::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...) trustledger::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_INDEX_TRACE(...) trustledger::util::LogManager::GetLogger("index")->trace(__VA_ARGS__)
#define LOG_INDEX_DEBUG(...) trustledger::util::LogManager::GetLogger("index")->debug(__VA_ARGS__)
#define LOG_INDEX_WARN(...) trustledger::util::LogManager::GetLogger("index")->warn(__VA_ARGS__)
#define LOG_INDEX_ERROR(...) trustledger::util::LogManager::GetLogger("index")->error(__VA_ARGS__)

#define LOG_STORAGE_TRACE(...) trustledger::util::LogManager::GetLogger("storage")->trace(__VA_ARGS__)
#define LOG_STORAGE_DEBUG(...) trustledger::util::LogManager::GetLogger("storage")->debug(__VA_ARGS__)
#define LOG_STORAGE_INFO(...) trustledger::util::LogManager::GetLogger("storage")->info(__VA_ARGS__)
#define LOG_STORAGE_WARN(...) trustledger::util::LogManager::GetLogger("storage")->warn(__VA_ARGS__)
#define LOG_STORAGE_ERROR(...) trustledger::util::LogManager::GetLogger("storage")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// For messages triggered by blocks received from peers. A misbehaving peer
// replaying invalid blocks must not be able to fill the disk with log lines.
// Budget: 200 messages per hour per callsite.

#include "util/rate_limiter.hpp"

#define CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_CHAIN_WARN_RL(...)                                                                                         \
  do {                                                                                                                 \
    if (trustledger::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                             \
      trustledger::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__);                                            \
    }                                                                                                                  \
  } while (0)

#define LOG_CHAIN_DEBUG_RL(...)                                                                                        \
  do {                                                                                                                 \
    if (trustledger::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                             \
      trustledger::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__);                                           \
    }                                                                                                                  \
  } while (0)
