// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include <algorithm>

namespace trustledger {
namespace util {

bool RateLimiter::should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds) {
  if (tokens_per_period <= 0 || period_seconds <= 0) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);

  const auto now = GetSteadyTime();
  auto& bucket = buckets_[callsite_key];

  if (!bucket.initialized) {
    bucket.tokens = static_cast<double>(tokens_per_period);
    bucket.last_refill = now;
    bucket.initialized = true;
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - bucket.last_refill).count();
  if (elapsed > 0) {
    const double refill_rate = static_cast<double>(tokens_per_period) / period_seconds;
    bucket.tokens = std::min(bucket.tokens + refill_rate * static_cast<double>(elapsed),
                             static_cast<double>(tokens_per_period));
    bucket.last_refill = now;
  }

  if (bucket.tokens >= 1.0) {
    bucket.tokens -= 1.0;
    return true;
  }
  return false;
}

void RateLimiter::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  buckets_.clear();
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter instance;
  return instance;
}

}  // namespace util
}  // namespace trustledger
