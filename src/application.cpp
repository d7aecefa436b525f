// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include "util/logging.hpp"

namespace trustledger {
namespace app {

Application::Application(const AppConfig& config) : config_(config) {}

Application::~Application() {
  shutdown();
}

bool Application::initialize() {
  LOG_INFO("Initializing trustledger...");

  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_params()) {
    LOG_ERROR("Failed to load currency parameters");
    return false;
  }

  if (!init_chain()) {
    LOG_ERROR("Failed to initialize chain state");
    return false;
  }

  // Subscribe to fatal error notifications: stop writing anything back
  fatal_error_sub_ = Notifications().SubscribeFatalError(
      [this](const std::string& debug_message, const std::string& user_message) {
        LOG_ERROR("Application: Fatal error - {}", debug_message);
        if (!user_message.empty()) {
          LOG_ERROR("User message: {}", user_message);
        }
        fatal_error_ = true;
      });

  tip_sub_ = Notifications().SubscribeChainTip([this](const ChainTipEvent& event) {
    (void)event;
    dirty_ = true;
  });

  initialized_ = true;
  start_periodic_saves();
  LOG_INFO("Initialization complete");
  return true;
}

void Application::shutdown() {
  if (!initialized_ && !locked_) {
    return;
  }

  stop_periodic_saves();
  fatal_error_sub_.Unsubscribe();
  tip_sub_.Unsubscribe();

  if (initialized_ && dirty_ && !fatal_error_) {
    LOG_INFO("Saving chain state to disk...");
    if (!save_chainstate()) {
      LOG_ERROR("Failed to save chain state");
    }
  } else if (fatal_error_) {
    LOG_ERROR("Chain state not saved after a fatal error");
  }
  initialized_ = false;

  if (locked_) {
    LOG_DEBUG("Releasing data directory lock...");
    util::UnlockDirectory(config_.datadir, ".lock");
    locked_ = false;
  }
}

bool Application::save_chainstate() {
  if (!coordinator_) {
    return false;
  }
  std::lock_guard<std::mutex> lock(save_mutex_);
  // Cleared first: a tip change during the write marks the image dirty again
  const bool was_dirty = dirty_.exchange(false);
  if (!coordinator_->Save(chainstate_file().string())) {
    if (was_dirty) {
      dirty_ = true;
    }
    return false;
  }
  return true;
}

void Application::start_periodic_saves() {
  if (config_.save_interval.count() <= 0 || save_thread_) {
    return;
  }
  LOG_INFO("Starting periodic chain state saves (every {} seconds)", config_.save_interval.count());
  {
    std::lock_guard<std::mutex> lock(save_thread_mutex_);
    saves_running_ = true;
  }
  save_thread_ = std::make_unique<std::thread>(&Application::periodic_save_loop, this);
}

void Application::stop_periodic_saves() {
  {
    std::lock_guard<std::mutex> lock(save_thread_mutex_);
    saves_running_ = false;
  }
  save_thread_cv_.notify_all();
  if (save_thread_ && save_thread_->joinable()) {
    LOG_DEBUG("Stopping periodic save thread");
    save_thread_->join();
  }
  save_thread_.reset();
}

void Application::periodic_save_loop() {
  std::unique_lock<std::mutex> lock(save_thread_mutex_);
  while (saves_running_) {
    if (save_thread_cv_.wait_for(lock, config_.save_interval, [this] { return !saves_running_; })) {
      break;
    }
    if (!dirty_ || fatal_error_) {
      continue;
    }
    lock.unlock();
    if (save_chainstate()) {
      LOG_DEBUG("Periodic chain state save done");
    } else {
      LOG_WARN("Periodic chain state save failed, retrying in {} seconds", config_.save_interval.count());
    }
    lock.lock();
  }
}

bool Application::reset() {
  if (!coordinator_) {
    return false;
  }
  coordinator_->Reset();
  fatal_error_ = false;
  LOG_INFO("Chain data reset");
  return save_chainstate();
}

bool Application::init_datadir() {
  if (config_.datadir.empty()) {
    LOG_ERROR("Data directory is not set. HOME may not be set; use --datadir to specify one.");
    return false;
  }

  LOG_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  util::LockResult lock_result = util::LockDirectory(config_.datadir, ".lock");

  if (lock_result == util::LockResult::ErrorWrite) {
    LOG_ERROR("Cannot write to data directory: {}", config_.datadir.string());
    return false;
  }

  if (lock_result == util::LockResult::ErrorLock) {
    LOG_ERROR("Cannot obtain a lock on data directory {}. "
              "Another trustledger process is probably using it.",
              config_.datadir.string());
    return false;
  }

  locked_ = true;
  LOG_DEBUG("Successfully locked data directory");
  return true;
}

bool Application::init_params() {
  const std::filesystem::path params_file =
      config_.currency_params_file ? *config_.currency_params_file : config_.datadir / "currency_params.json";

  std::error_code ec;
  if (std::filesystem::exists(params_file, ec)) {
    currency_params_ = chain::CurrencyParams::LoadFromFile(params_file);
    if (!currency_params_) {
      return false;
    }
    LOG_INFO("Using currency parameters from {}", params_file.string());
  } else if (config_.currency_params_file) {
    LOG_ERROR("Currency parameter file not found: {}", params_file.string());
    return false;
  } else {
    currency_params_ = config_.regtest ? chain::CurrencyParams::CreateRegTest() : chain::CurrencyParams::CreateDefault();
    LOG_INFO("Using built-in {} currency parameters", config_.regtest ? "regtest" : "default");
  }

  LOG_DEBUG("Currency '{}': fork window {}, max forks {}, cert validity {} blocks",
            currency_params_->currency_name, currency_params_->fork_window_size, currency_params_->max_forks,
            currency_params_->cert_validity_blocks);
  return true;
}

bool Application::init_chain() {
  LOG_INFO("Initializing chain state...");

  coordinator_ = std::make_unique<validation::WriteCoordinator>(*currency_params_);
  if (!config_.load_chainstate) {
    LOG_DEBUG("Chain state load skipped");
    return true;
  }

  const std::string chainstate_path = chainstate_file().string();
  chain::LoadResult load_result = coordinator_->Load(chainstate_path);

  switch (load_result) {
  case chain::LoadResult::SUCCESS:
    LOG_INFO("Loaded chain state from disk");
    break;

  case chain::LoadResult::FILE_NOT_FOUND:
    LOG_INFO("No existing chain state found, starting with an empty chain");
    break;

  case chain::LoadResult::CORRUPTED:
    // Requires manual intervention: reset, then re-import
    LOG_ERROR("FATAL: Chain state file {} is corrupted!", chainstate_path);
    LOG_ERROR("Run the reset command and re-import the blocks.");
    LOG_ERROR("Refusing to start to prevent data loss.");
    return false;
  }

  const auto tip = coordinator_->GetTipBlockstamp();
  LOG_INFO("Chain state initialized at {}", tip ? tip->ToString() : "empty chain");
  return true;
}

}  // namespace app
}  // namespace trustledger
