#pragma once

#include <cstdint>

#include "internal/model/types.hpp"

namespace lending::inventory {

/*
  Unit balances keyed by (holder, item). Transfers are atomic per call.
*/
class InventoryLedger {
 public:
  virtual ~InventoryLedger() = default;

  virtual std::uint64_t BalanceOf(const lending::model::AccountId& holder, lending::model::ItemId item_id) const = 0;

  // Throws ResourceExhausted(kInsufficientUnits) when `from` holds fewer than `quantity` units.
  virtual void Transfer(const lending::model::AccountId& from, const lending::model::AccountId& to, lending::model::ItemId item_id,
                        std::uint64_t quantity) = 0;

  virtual void Mint(const lending::model::AccountId& to, lending::model::ItemId item_id, std::uint64_t quantity) = 0;
};

} // namespace lending::inventory
