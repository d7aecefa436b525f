// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include "chain/currency_params.hpp"
#include "chain/notifications.hpp"
#include "chain/write_coordinator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace trustledger {
namespace app {

struct AppConfig {
  std::filesystem::path datadir;
  std::string log_level{"warn"};
  bool log_to_file{false};
  bool regtest{false};

  // Off for commands that replace the chain state wholesale (reset)
  bool load_chainstate{true};

  // Overrides currency_params.json in the data directory
  std::optional<std::filesystem::path> currency_params_file;

  // Chain state written back this often while it has changes; 0 disables
  std::chrono::seconds save_interval{600};
};

// Application - owns the process-level pieces around the chain core: data
// directory lock, currency parameters, the write coordinator and its on-disk
// image (chainstate.json). A background thread saves the image every
// save_interval while the tip keeps moving.
class Application {
public:
  explicit Application(const AppConfig& config);
  ~Application();

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;

  // Lock the data directory, load parameters and chain state
  bool initialize();

  // Stop periodic saves, save chain state if it changed, release the lock.
  // Idempotent.
  void shutdown();

  bool save_chainstate();

  // Unsaved tip changes pending
  bool dirty() const { return dirty_.load(); }

  // Drop all chain data (empty chain, file rewritten)
  bool reset();

  // Set once a FatalError notification was received
  bool fatal_error() const { return fatal_error_.load(); }

  validation::WriteCoordinator& coordinator() { return *coordinator_; }
  const chain::CurrencyParams& params() const { return *currency_params_; }

  std::filesystem::path chainstate_file() const { return config_.datadir / "chainstate.json"; }

private:
  bool init_datadir();
  bool init_params();
  bool init_chain();

  void start_periodic_saves();
  void stop_periodic_saves();
  void periodic_save_loop();

  AppConfig config_;

  std::unique_ptr<chain::CurrencyParams> currency_params_;
  std::unique_ptr<validation::WriteCoordinator> coordinator_;

  ChainNotifications::Subscription fatal_error_sub_;
  ChainNotifications::Subscription tip_sub_;

  std::unique_ptr<std::thread> save_thread_;
  std::mutex save_thread_mutex_;
  std::condition_variable save_thread_cv_;
  bool saves_running_{false};  // guarded by save_thread_mutex_

  // Serializes writes of chainstate.json
  std::mutex save_mutex_;

  std::atomic<bool> fatal_error_{false};
  std::atomic<bool> dirty_{false};
  bool initialized_{false};
  bool locked_{false};
};

}  // namespace app
}  // namespace trustledger
