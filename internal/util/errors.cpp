#include "errors.hpp"

namespace lending::util {

std::string_view ReasonName(ErrorReason reason) {
  switch (reason) {
    case ErrorReason::kNotMember:
      return "NotMember";
    case ErrorReason::kNotSteward:
      return "NotSteward";
    case ErrorReason::kNotCurator:
      return "NotCurator";
    case ErrorReason::kNoSuchItem:
      return "NoSuchItem";
    case ErrorReason::kNoSuchLoan:
      return "NoSuchLoan";
    case ErrorReason::kActiveLoanExists:
      return "ActiveLoanExists";
    case ErrorReason::kNoActiveLoan:
      return "NoActiveLoan";
    case ErrorReason::kMaxExtensionsReached:
      return "MaxExtensionsReached";
    case ErrorReason::kNotHolder:
      return "NotHolder";
    case ErrorReason::kItemPaused:
      return "ItemPaused";
    case ErrorReason::kDepositTooLow:
      return "DepositTooLow";
    case ErrorReason::kZeroDuration:
      return "ZeroDuration";
    case ErrorReason::kZeroDeposit:
      return "ZeroDeposit";
    case ErrorReason::kBranchUnset:
      return "BranchUnset";
    case ErrorReason::kZeroAmount:
      return "ZeroAmount";
    case ErrorReason::kInvalidMetadata:
      return "InvalidMetadata";
    case ErrorReason::kInvalidAccount:
      return "InvalidAccount";
    case ErrorReason::kUnavailable:
      return "Unavailable";
    case ErrorReason::kInsufficientUnits:
      return "InsufficientUnits";
    case ErrorReason::kInsufficientPool:
      return "InsufficientPool";
    case ErrorReason::kInsufficientFunds:
      return "InsufficientFunds";
  }
  return "Unknown";
}

} // namespace lending::util
