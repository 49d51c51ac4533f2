#pragma once

#include <cstdint>

#include "types.hpp"

namespace lending::model {

/*
  An open loan. Absence of a loan is expressed with std::optional<Loan>;
  a present record always has a non-zero due date and deposit.
*/
struct Loan {
  AccountId     custodian;
  Timestamp     opened_at       = 0;
  Timestamp     due_date        = 0;
  Amount        deposit         = 0;
  std::uint32_t extensions_used = 0;
  // Set while the refund of an on-time return is being paid out. The unit
  // and the escrowed deposit stay with the loan until the payout settles.
  bool          returning       = false;
};

} // namespace lending::model
