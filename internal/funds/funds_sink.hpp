#pragma once

#include "internal/model/types.hpp"

namespace lending::funds {

/*
  Value held by the ledger on behalf of borrowers and the custodian.

  Received() credits value sent along with a borrow. PayOut() moves value to
  an external account and throws ResourceExhausted(kInsufficientFunds) when
  the held balance does not cover it.
*/
class FundsSink {
 public:
  virtual ~FundsSink() = default;

  virtual void Received(lending::model::Amount amount) = 0;

  virtual void PayOut(const lending::model::AccountId& to, lending::model::Amount amount) = 0;

  virtual lending::model::Amount Balance() const = 0;
};

} // namespace lending::funds
