#include "escrow_vault.hpp"

#include <string>

#include "internal/events/event_sink.hpp"
#include "internal/funds/funds_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace lending::escrow {

using lending::model::Amount;
using lending::model::LoanKey;
using lending::util::ErrorReason;

EscrowVault::EscrowVault(std::shared_ptr<lending::funds::FundsSink> funds, std::shared_ptr<lending::events::EventSink> events)
    : funds_(std::move(funds)), events_(std::move(events)) {
  if (!funds_) {
    throw std::invalid_argument("escrow vault requires a funds sink");
  }
}

void EscrowVault::Lock(const LoanKey& key, Amount amount) {
  if (amount == 0) {
    throw lending::util::InvalidValue(ErrorReason::kZeroAmount, "escrow lock: amount must be positive for " + lending::model::ToString(key));
  }

  std::lock_guard lock(mutex_);
  auto [it, inserted] = deposits_.emplace(key, amount);
  if (!inserted) {
    throw lending::util::StateConflict(ErrorReason::kActiveLoanExists, "escrow lock: deposit already held for " + lending::model::ToString(key));
  }
  total_escrowed_ += amount;
}

Amount EscrowVault::Release(const LoanKey& key) {
  std::lock_guard lock(mutex_);
  auto            it = deposits_.find(key);
  if (it == deposits_.end()) {
    throw lending::util::NotFound(ErrorReason::kNoSuchLoan, "escrow release: no deposit held for " + lending::model::ToString(key));
  }
  const Amount amount = it->second;
  deposits_.erase(it);
  total_escrowed_ -= amount;
  return amount;
}

Amount EscrowVault::Forfeit(const LoanKey& key) {
  std::lock_guard lock(mutex_);
  auto            it = deposits_.find(key);
  if (it == deposits_.end()) {
    throw lending::util::NotFound(ErrorReason::kNoSuchLoan, "escrow forfeit: no deposit held for " + lending::model::ToString(key));
  }
  const Amount amount = it->second;
  deposits_.erase(it);
  total_escrowed_ -= amount;
  pool_ += amount;
  return amount;
}

void EscrowVault::WithdrawPool(const lending::policy::AccessPolicy& access, const lending::model::AccountId& caller,
                               const lending::model::AccountId& to, Amount amount) {
  access.RequireSteward(caller, "withdraw forfeited pool");
  if (amount == 0) {
    throw lending::util::InvalidValue(ErrorReason::kZeroAmount, "withdraw forfeited pool: amount must be positive");
  }
  if (to.empty()) {
    throw lending::util::InvalidValue(ErrorReason::kInvalidAccount, "withdraw forfeited pool: recipient must not be empty");
  }

  Amount remaining = 0;
  {
    std::lock_guard lock(mutex_);
    if (amount > pool_) {
      throw lending::util::ResourceExhausted(ErrorReason::kInsufficientPool, "withdraw forfeited pool: requested " + std::to_string(amount) +
                                                                                 " exceeds pool balance " + std::to_string(pool_));
    }
    pool_ -= amount;
    remaining = pool_;
  }

  try {
    funds_->PayOut(to, amount);
  } catch (const std::exception& e) {
    {
      std::lock_guard lock(mutex_);
      pool_ += amount;
    }
    LENDING_LOG_ERROR("pool withdrawal payout failed",
                      {lending::observability::StringField("to", to), lending::observability::UintField("amount", amount),
                       lending::observability::StringField("error", e.what())});
    throw;
  }

  if (events_) events_->Publish(lending::model::PoolWithdrawn{to, amount, remaining});
}

Amount EscrowVault::Escrowed(const LoanKey& key) const {
  std::lock_guard lock(mutex_);
  auto            it = deposits_.find(key);
  return it == deposits_.end() ? 0 : it->second;
}

Amount EscrowVault::PoolBalance() const {
  std::lock_guard lock(mutex_);
  return pool_;
}

Amount EscrowVault::TotalEscrowed() const {
  std::lock_guard lock(mutex_);
  return total_escrowed_;
}

} // namespace lending::escrow
