// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <mutex>
#include <string>
#include <vector>

namespace trustledger {

// Event payloads are plain values copied out of the committed state, safe to
// keep after the writer lock is released.

struct BlockConnectedEvent {
  Blockstamp blockstamp;
  int64_t median_time{0};
  size_t transaction_count{0};
  std::optional<int64_t> dividend;
};

struct BlockDisconnectedEvent {
  Blockstamp blockstamp;
};

struct ChainTipEvent {
  Blockstamp tip;
  bool reorganized{false};  // tip changed through a fork switch
};

// ChainNotifications - process-wide observer registry for chain events.
//
// Callbacks run synchronously on the writer thread, after the write has been
// committed and the writer lock released. Subscriptions are RAII handles.
//
// Events:
// - BlockConnected: block applied to the main chain
// - BlockDisconnected: block reverted from the main chain (reorganization)
// - ChainTip: main chain tip changed (may skip intermediate blocks)
// - FatalError: corruption or poisoned writer; the chain must not be used further
class ChainNotifications {
public:
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void Unsubscribe();

  private:
    friend class ChainNotifications;
    Subscription(ChainNotifications* owner, size_t id);

    ChainNotifications* owner_{nullptr};
    size_t id_{0};
  };

  using BlockConnectedCallback = std::function<void(const BlockConnectedEvent& event)>;
  using BlockDisconnectedCallback = std::function<void(const BlockDisconnectedEvent& event)>;
  using ChainTipCallback = std::function<void(const ChainTipEvent& event)>;
  using FatalErrorCallback = std::function<void(const std::string& debug_message, const std::string& user_message)>;

  [[nodiscard]] Subscription SubscribeBlockConnected(BlockConnectedCallback callback);
  [[nodiscard]] Subscription SubscribeBlockDisconnected(BlockDisconnectedCallback callback);
  [[nodiscard]] Subscription SubscribeChainTip(ChainTipCallback callback);
  [[nodiscard]] Subscription SubscribeFatalError(FatalErrorCallback callback);

  void NotifyBlockConnected(const BlockConnectedEvent& event);
  void NotifyBlockDisconnected(const BlockDisconnectedEvent& event);
  void NotifyChainTip(const ChainTipEvent& event);
  void NotifyFatalError(const std::string& debug_message, const std::string& user_message);

  static ChainNotifications& Get();

private:
  ChainNotifications() = default;

  void Unsubscribe(size_t id);

  struct CallbackEntry {
    size_t id{0};
    BlockConnectedCallback block_connected;
    BlockDisconnectedCallback block_disconnected;
    ChainTipCallback chain_tip;
    FatalErrorCallback fatal_error;
  };

  Subscription Add(CallbackEntry entry);

  // Copy the matching callbacks under the lock, run them without it so a
  // callback may subscribe or unsubscribe.
  template <typename Callback, typename... Args>
  void Dispatch(Callback CallbackEntry::*member, const Args&... args);

  std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1};  // 0 = inactive subscription
};

inline ChainNotifications& Notifications() {
  return ChainNotifications::Get();
}

}  // namespace trustledger
