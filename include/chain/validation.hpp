// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace trustledger {
namespace validation {

// Consensus rule identifiers. Lower numbers are evaluated first.
enum class RuleNumber : uint32_t {
  NONE = 0,
  NO_PREVIOUS_BLOCK = 2,       // pre-condition, checked before the registry runs
  PREVIOUS_ISSUER = 3,         // declared previous issuer == issuer of block N-1
  ISSUERS_COUNT = 4,           // reserved
  ISSUERS_FRAME = 5,           // reserved
  ISSUER_IS_MEMBER = 100,      // issuer is an active member as of block N-1
  VERSION_NOT_DECREASING = 101 // version(N) >= version(N-1)
};

// Storage-level failure classes
enum class StoreError : uint8_t {
  NONE = 0,
  NOT_FOUND,      // benign at read APIs (std::nullopt)
  CORRUPTION,     // fatal, never repaired automatically
  WRITE_ABORT,    // transaction voluntarily aborted; nothing was committed
  POISONED_LOCK   // a previous write died mid-flight; writer refuses further work
};

const char* RuleNumberName(RuleNumber rule);
const char* StoreErrorName(StoreError error);

// Result of validating or applying a block.
//
// VALID:   nothing went wrong
// INVALID: the block breaks a consensus rule or a submission policy; chain
//          state is untouched and the caller may drop the block
// ERROR:   storage failure, see GetStoreError(); WRITE_ABORT leaves state
//          untouched, CORRUPTION and POISONED_LOCK are fatal
class ValidationState {
public:
  enum class Mode { VALID, INVALID, ERROR };

  ValidationState() = default;

  bool Invalid(const std::string& reject_reason, const std::string& debug_message = "") {
    mode_ = Mode::INVALID;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  bool Invalid(RuleNumber rule, const std::string& reject_reason, const std::string& debug_message = "") {
    rule_ = rule;
    return Invalid(reject_reason, debug_message);
  }

  bool Error(StoreError error, const std::string& debug_message) {
    mode_ = Mode::ERROR;
    store_error_ = error;
    reject_reason_ = StoreErrorName(error);
    debug_message_ = debug_message;
    return false;
  }

  bool Error(const std::string& debug_message) { return Error(StoreError::CORRUPTION, debug_message); }

  bool IsValid() const { return mode_ == Mode::VALID; }
  bool IsInvalid() const { return mode_ == Mode::INVALID; }
  bool IsError() const { return mode_ == Mode::ERROR; }

  // CORRUPTION or POISONED_LOCK
  bool IsFatal() const {
    return mode_ == Mode::ERROR &&
           (store_error_ == StoreError::CORRUPTION || store_error_ == StoreError::POISONED_LOCK);
  }

  Mode GetMode() const { return mode_; }
  RuleNumber GetRule() const { return rule_; }
  StoreError GetStoreError() const { return store_error_; }
  const std::string& GetRejectReason() const { return reject_reason_; }
  const std::string& GetDebugMessage() const { return debug_message_; }

  std::string ToString() const;

private:
  Mode mode_{Mode::VALID};
  RuleNumber rule_{RuleNumber::NONE};
  StoreError store_error_{StoreError::NONE};
  std::string reject_reason_;
  std::string debug_message_;
};

}  // namespace validation
}  // namespace trustledger
