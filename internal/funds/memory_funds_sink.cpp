#include "memory_funds_sink.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace lending::funds {

using lending::util::ErrorReason;

MemoryFundsSink::MemoryFundsSink(lending::model::Amount opening_balance) : balance_(opening_balance) {
}

void MemoryFundsSink::Received(lending::model::Amount amount) {
  std::lock_guard lock(mutex_);
  balance_ += amount;
}

void MemoryFundsSink::PayOut(const lending::model::AccountId& to, lending::model::Amount amount) {
  std::lock_guard lock(mutex_);
  if (amount > balance_) {
    throw lending::util::ResourceExhausted(ErrorReason::kInsufficientFunds, "pay out: held balance " + std::to_string(balance_) +
                                                                                " does not cover " + std::to_string(amount) + " to " + to);
  }
  balance_ -= amount;
  paid_[to] += amount;
}

lending::model::Amount MemoryFundsSink::Balance() const {
  std::lock_guard lock(mutex_);
  return balance_;
}

lending::model::Amount MemoryFundsSink::PaidTo(const lending::model::AccountId& account) const {
  std::lock_guard lock(mutex_);
  auto            it = paid_.find(account);
  return it == paid_.end() ? 0 : it->second;
}

} // namespace lending::funds
