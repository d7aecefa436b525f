// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "util/hash.hpp"

#include <algorithm>

namespace trustledger {

namespace {

int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::optional<Hash> Hash::FromHex(std::string_view hex) {
  if (hex.empty() || hex.size() > SIZE * 2) {
    return std::nullopt;
  }

  std::string padded(SIZE * 2 - hex.size(), '0');
  padded.append(hex);

  Hash result;
  for (size_t i = 0; i < SIZE; ++i) {
    const int hi = HexDigit(padded[2 * i]);
    const int lo = HexDigit(padded[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    result.data_[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return result;
}

std::string Hash::ToString() const {
  static constexpr char kDigits[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(SIZE * 2);
  for (uint8_t byte : data_) {
    out.push_back(kDigits[byte >> 4]);
    out.push_back(kDigits[byte & 0x0f]);
  }
  return out;
}

bool Hash::IsNull() const {
  return std::all_of(data_.begin(), data_.end(), [](uint8_t b) { return b == 0; });
}

}  // namespace trustledger
