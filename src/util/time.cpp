// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace trustledger {
namespace util {

namespace {

std::atomic<int64_t> g_mock_time{0};

// Anchor used to translate mock seconds into steady_clock points.
struct SteadyAnchor {
  std::mutex mutex;
  std::chrono::steady_clock::time_point real_reference;
  int64_t mock_reference{0};
  bool set{false};
};

SteadyAnchor& Anchor() {
  static SteadyAnchor anchor;
  return anchor;
}

}  // namespace

int64_t GetTime() {
  const int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  const int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock == 0) {
    return std::chrono::steady_clock::now();
  }

  auto& anchor = Anchor();
  std::lock_guard<std::mutex> lock(anchor.mutex);
  if (!anchor.set) {
    anchor.real_reference = std::chrono::steady_clock::now();
    anchor.mock_reference = mock;
    anchor.set = true;
  }
  return anchor.real_reference + std::chrono::seconds(mock - anchor.mock_reference);
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);
  if (time == 0) {
    auto& anchor = Anchor();
    std::lock_guard<std::mutex> lock(anchor.mutex);
    anchor.set = false;
  }
}

int64_t GetMockTime() {
  return g_mock_time.load(std::memory_order_relaxed);
}

std::string FormatTime(int64_t unix_time) {
  const std::chrono::sys_seconds secs{std::chrono::seconds{unix_time}};
  const auto days = std::chrono::floor<std::chrono::days>(secs);
  const std::chrono::year_month_day ymd{days};
  const std::chrono::hh_mm_ss hms{secs - days};

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << "-" << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << "-" << std::setw(2) << static_cast<unsigned>(ymd.day()) << " "
      << std::setw(2) << hms.hours().count() << ":" << std::setw(2) << hms.minutes().count() << ":" << std::setw(2)
      << hms.seconds().count() << " UTC";
  return oss.str();
}

}  // namespace util
}  // namespace trustledger
