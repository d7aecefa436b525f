// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "chain/validation.hpp"

namespace trustledger {
namespace validation {

const char* RuleNumberName(RuleNumber rule) {
  switch (rule) {
  case RuleNumber::NONE:
    return "none";
  case RuleNumber::NO_PREVIOUS_BLOCK:
    return "no-previous-block";
  case RuleNumber::PREVIOUS_ISSUER:
    return "previous-issuer";
  case RuleNumber::ISSUERS_COUNT:
    return "issuers-count";
  case RuleNumber::ISSUERS_FRAME:
    return "issuers-frame";
  case RuleNumber::ISSUER_IS_MEMBER:
    return "issuer-is-member";
  case RuleNumber::VERSION_NOT_DECREASING:
    return "version-not-decreasing";
  }
  return "unknown";
}

const char* StoreErrorName(StoreError error) {
  switch (error) {
  case StoreError::NONE:
    return "none";
  case StoreError::NOT_FOUND:
    return "not-found";
  case StoreError::CORRUPTION:
    return "corruption";
  case StoreError::WRITE_ABORT:
    return "write-abort";
  case StoreError::POISONED_LOCK:
    return "poisoned-lock";
  }
  return "unknown";
}

std::string ValidationState::ToString() const {
  switch (mode_) {
  case Mode::VALID:
    return "valid";
  case Mode::INVALID: {
    std::string out = reject_reason_;
    if (rule_ != RuleNumber::NONE) {
      out += " (rule " + std::to_string(static_cast<uint32_t>(rule_)) + ")";
    }
    if (!debug_message_.empty()) {
      out += ", " + debug_message_;
    }
    return out;
  }
  case Mode::ERROR:
    return std::string("error: ") + StoreErrorName(store_error_) +
           (debug_message_.empty() ? "" : ", " + debug_message_);
  }
  return "unknown";
}

}  // namespace validation
}  // namespace trustledger
