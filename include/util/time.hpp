// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace trustledger {
namespace util {

// Wall clock in unix seconds, or the mock time when one is set.
int64_t GetTime();

// Monotonic clock that follows mock time while it is set.
std::chrono::steady_clock::time_point GetSteadyTime();

// 0 disables mock time.
void SetMockTime(int64_t time);
int64_t GetMockTime();

// "YYYY-MM-DD HH:MM:SS UTC"
std::string FormatTime(int64_t unix_time);

}  // namespace util
}  // namespace trustledger
