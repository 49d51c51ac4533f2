#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lending::util {

/*
  Central error types.

  Every failure carries a machine-readable reason. The exception class picks
  the kind (and therefore the gRPC status); the reason picks the exact
  precondition that failed.
*/

enum class ErrorReason : std::uint8_t {
  kNotMember,
  kNotSteward,
  kNotCurator,

  kNoSuchItem,
  kNoSuchLoan,

  kActiveLoanExists,
  kNoActiveLoan,
  kMaxExtensionsReached,
  kNotHolder,
  kItemPaused,

  kDepositTooLow,
  kZeroDuration,
  kZeroDeposit,
  kBranchUnset,
  kZeroAmount,
  kInvalidMetadata,
  kInvalidAccount,

  kUnavailable,
  kInsufficientUnits,
  kInsufficientPool,
  kInsufficientFunds,
};

std::string_view ReasonName(ErrorReason reason);

class LendingError : public std::runtime_error {
 public:
  LendingError(ErrorReason reason, const std::string& msg) : std::runtime_error(msg), reason_(reason) {
  }

  ErrorReason Reason() const noexcept {
    return reason_;
  }

 private:
  ErrorReason reason_;
};

class Unauthorized : public LendingError {
 public:
  Unauthorized(ErrorReason reason, const std::string& msg) : LendingError(reason, msg) {
  }
};

class NotFound : public LendingError {
 public:
  NotFound(ErrorReason reason, const std::string& msg) : LendingError(reason, msg) {
  }
};

class StateConflict : public LendingError {
 public:
  StateConflict(ErrorReason reason, const std::string& msg) : LendingError(reason, msg) {
  }
};

class InvalidValue : public LendingError {
 public:
  InvalidValue(ErrorReason reason, const std::string& msg) : LendingError(reason, msg) {
  }
};

class ResourceExhausted : public LendingError {
 public:
  ResourceExhausted(ErrorReason reason, const std::string& msg) : LendingError(reason, msg) {
  }
};

} // namespace lending::util
