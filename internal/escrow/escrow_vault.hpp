#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>

#include "internal/model/types.hpp"
#include "internal/policy/access_policy.hpp"

namespace lending::events {
class EventSink;
}
namespace lending::funds {
class FundsSink;
}

namespace lending::escrow {

/*
  Deposits held per open loan plus one pooled balance of forfeited deposits.

  Lock/Release/Forfeit only move accounting entries; the value itself sits in
  the FundsSink. The only external transfer made here is WithdrawPool, which
  pays out after the pool has been debited.
*/
class EscrowVault {
 public:
  EscrowVault(std::shared_ptr<lending::funds::FundsSink> funds, std::shared_ptr<lending::events::EventSink> events);

  void Lock(const lending::model::LoanKey& key, lending::model::Amount amount);

  // Zero the entry and return what it held.
  lending::model::Amount Release(const lending::model::LoanKey& key);

  // Zero the entry and add what it held to the forfeited pool.
  lending::model::Amount Forfeit(const lending::model::LoanKey& key);

  void WithdrawPool(const lending::policy::AccessPolicy& access, const lending::model::AccountId& caller, const lending::model::AccountId& to,
                    lending::model::Amount amount);

  lending::model::Amount Escrowed(const lending::model::LoanKey& key) const;
  lending::model::Amount PoolBalance() const;
  lending::model::Amount TotalEscrowed() const;

 private:
  mutable std::mutex                                                                   mutex_;
  std::unordered_map<lending::model::LoanKey, lending::model::Amount, lending::model::LoanKeyHash> deposits_;
  lending::model::Amount                                                               pool_          = 0;
  lending::model::Amount                                                               total_escrowed_ = 0;

  std::shared_ptr<lending::funds::FundsSink>  funds_;
  std::shared_ptr<lending::events::EventSink> events_;
};

} // namespace lending::escrow
