#pragma once

#include <map>
#include <mutex>
#include <utility>

#include "inventory_ledger.hpp"

namespace lending::inventory {

class MemoryInventoryLedger final : public InventoryLedger {
 public:
  std::uint64_t BalanceOf(const lending::model::AccountId& holder, lending::model::ItemId item_id) const override;

  void Transfer(const lending::model::AccountId& from, const lending::model::AccountId& to, lending::model::ItemId item_id,
                std::uint64_t quantity) override;

  void Mint(const lending::model::AccountId& to, lending::model::ItemId item_id, std::uint64_t quantity) override;

  std::uint64_t TotalSupply(lending::model::ItemId item_id) const;

 private:
  using Key = std::pair<lending::model::AccountId, lending::model::ItemId>;

  mutable std::mutex                    mutex_;
  std::map<Key, std::uint64_t>          balances_;
  std::map<lending::model::ItemId, std::uint64_t> supply_;
};

} // namespace lending::inventory
