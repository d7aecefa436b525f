// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace trustledger {
namespace util {

/**
 * RateLimiter - token bucket per log callsite
 *
 * Each callsite starts with a full bucket of `tokens_per_period` tokens that
 * refills linearly over `period_seconds`. Used by the *_RL logging macros.
 */
class RateLimiter {
public:
  // True if the message at `callsite_key` may be logged now.
  bool should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds);

  // Forget all buckets.
  void reset();

  static RateLimiter& instance();

private:
  struct TokenBucket {
    double tokens{0.0};
    std::chrono::steady_clock::time_point last_refill{GetSteadyTime()};
    bool initialized{false};
  };

  std::mutex mutex_;
  std::unordered_map<std::string, TokenBucket> buckets_;
};

}  // namespace util
}  // namespace trustledger
