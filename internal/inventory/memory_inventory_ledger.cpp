#include "memory_inventory_ledger.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace lending::inventory {

using lending::util::ErrorReason;

std::uint64_t MemoryInventoryLedger::BalanceOf(const lending::model::AccountId& holder, lending::model::ItemId item_id) const {
  std::lock_guard lock(mutex_);
  auto            it = balances_.find({holder, item_id});
  return it == balances_.end() ? 0 : it->second;
}

void MemoryInventoryLedger::Transfer(const lending::model::AccountId& from, const lending::model::AccountId& to, lending::model::ItemId item_id,
                                     std::uint64_t quantity) {
  if (quantity == 0) {
    throw lending::util::InvalidValue(ErrorReason::kZeroAmount, "transfer units: quantity must be positive");
  }

  std::lock_guard lock(mutex_);
  auto            from_it = balances_.find({from, item_id});
  if (from_it == balances_.end() || from_it->second < quantity) {
    throw lending::util::ResourceExhausted(ErrorReason::kInsufficientUnits, "transfer units: " + from + " holds fewer than " +
                                                                                std::to_string(quantity) + " units of item " +
                                                                                std::to_string(item_id));
  }
  if (from == to) {
    return;
  }

  from_it->second -= quantity;
  if (from_it->second == 0) {
    balances_.erase(from_it);
  }
  balances_[{to, item_id}] += quantity;
}

void MemoryInventoryLedger::Mint(const lending::model::AccountId& to, lending::model::ItemId item_id, std::uint64_t quantity) {
  if (quantity == 0) {
    throw lending::util::InvalidValue(ErrorReason::kZeroAmount, "mint units: quantity must be positive");
  }

  std::lock_guard lock(mutex_);
  balances_[{to, item_id}] += quantity;
  supply_[item_id] += quantity;
}

std::uint64_t MemoryInventoryLedger::TotalSupply(lending::model::ItemId item_id) const {
  std::lock_guard lock(mutex_);
  auto            it = supply_.find(item_id);
  return it == supply_.end() ? 0 : it->second;
}

} // namespace lending::inventory
