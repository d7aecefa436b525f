// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace trustledger {

// 256-bit block or transaction hash. Hashes are computed and checked by the
// document layer; this core only compares, orders and prints them.
class Hash {
public:
  static constexpr size_t SIZE = 32;

  constexpr Hash() = default;

  // Parse 1..64 hex digits (either case). Shorter input is left-padded with zeros.
  static std::optional<Hash> FromHex(std::string_view hex);

  // 64 uppercase hex digits
  std::string ToString() const;

  bool IsNull() const;
  void SetNull() { data_.fill(0); }

  const uint8_t* data() const { return data_.data(); }

  auto operator<=>(const Hash&) const = default;
  bool operator==(const Hash&) const = default;

private:
  std::array<uint8_t, SIZE> data_{};
};

}  // namespace trustledger
