#pragma once

#include <cstdint>
#include <optional>

#include "loan.hpp"

namespace lending::model {

enum class LoanState : std::uint8_t {
  kAvailable = 0,
  kBorrowed  = 1,
  kExtended  = 2,
  kReturned  = 3,
  kReturning = 4,
};

constexpr bool IsOutstanding(LoanState state) {
  return state == LoanState::kBorrowed || state == LoanState::kExtended;
}

// Returned is terminal for the loan but equivalent to Available for the key.
constexpr bool CanTransition(LoanState from, LoanState to) {
  switch (to) {
    case LoanState::kBorrowed:
      return from == LoanState::kAvailable || from == LoanState::kReturned;
    case LoanState::kExtended:
      return IsOutstanding(from);
    case LoanState::kReturning:
      return IsOutstanding(from);
    case LoanState::kReturned:
      return IsOutstanding(from) || from == LoanState::kReturning;
    case LoanState::kAvailable:
      return false;
  }
  return false;
}

inline LoanState StateOf(const std::optional<Loan>& loan) {
  if (!loan.has_value()) {
    return LoanState::kAvailable;
  }
  if (loan->returning) {
    return LoanState::kReturning;
  }
  return loan->extensions_used > 0 ? LoanState::kExtended : LoanState::kBorrowed;
}

const char* ToString(LoanState state);

} // namespace lending::model
