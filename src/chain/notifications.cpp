// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "chain/notifications.hpp"

#include <algorithm>

namespace trustledger {

ChainNotifications::Subscription::Subscription(ChainNotifications* owner, size_t id) : owner_(owner), id_(id) {}

ChainNotifications::Subscription::~Subscription() {
  Unsubscribe();
}

ChainNotifications::Subscription::Subscription(Subscription&& other) noexcept
    : owner_(other.owner_), id_(other.id_) {
  other.owner_ = nullptr;
  other.id_ = 0;
}

ChainNotifications::Subscription& ChainNotifications::Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    other.owner_ = nullptr;
    other.id_ = 0;
  }
  return *this;
}

void ChainNotifications::Subscription::Unsubscribe() {
  if (owner_ && id_ != 0) {
    owner_->Unsubscribe(id_);
  }
  owner_ = nullptr;
  id_ = 0;
}

ChainNotifications::Subscription ChainNotifications::Add(CallbackEntry entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  entry.id = next_id_++;
  const size_t id = entry.id;
  callbacks_.push_back(std::move(entry));
  return Subscription(this, id);
}

ChainNotifications::Subscription ChainNotifications::SubscribeBlockConnected(BlockConnectedCallback callback) {
  CallbackEntry entry;
  entry.block_connected = std::move(callback);
  return Add(std::move(entry));
}

ChainNotifications::Subscription ChainNotifications::SubscribeBlockDisconnected(BlockDisconnectedCallback callback) {
  CallbackEntry entry;
  entry.block_disconnected = std::move(callback);
  return Add(std::move(entry));
}

ChainNotifications::Subscription ChainNotifications::SubscribeChainTip(ChainTipCallback callback) {
  CallbackEntry entry;
  entry.chain_tip = std::move(callback);
  return Add(std::move(entry));
}

ChainNotifications::Subscription ChainNotifications::SubscribeFatalError(FatalErrorCallback callback) {
  CallbackEntry entry;
  entry.fatal_error = std::move(callback);
  return Add(std::move(entry));
}

template <typename Callback, typename... Args>
void ChainNotifications::Dispatch(Callback CallbackEntry::*member, const Args&... args) {
  std::vector<Callback> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : callbacks_) {
      if (entry.*member) {
        snapshot.push_back(entry.*member);
      }
    }
  }
  for (const auto& callback : snapshot) {
    callback(args...);
  }
}

void ChainNotifications::NotifyBlockConnected(const BlockConnectedEvent& event) {
  Dispatch(&CallbackEntry::block_connected, event);
}

void ChainNotifications::NotifyBlockDisconnected(const BlockDisconnectedEvent& event) {
  Dispatch(&CallbackEntry::block_disconnected, event);
}

void ChainNotifications::NotifyChainTip(const ChainTipEvent& event) {
  Dispatch(&CallbackEntry::chain_tip, event);
}

void ChainNotifications::NotifyFatalError(const std::string& debug_message, const std::string& user_message) {
  Dispatch(&CallbackEntry::fatal_error, debug_message, user_message);
}

void ChainNotifications::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.erase(std::remove_if(callbacks_.begin(), callbacks_.end(),
                                  [id](const CallbackEntry& entry) { return entry.id == id; }),
                   callbacks_.end());
}

ChainNotifications& ChainNotifications::Get() {
  static ChainNotifications instance;
  return instance;
}

}  // namespace trustledger
