#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "policy.hpp"
#include "types.hpp"

namespace lending::model {

/*
  Ledger events. One event per committed state change; emitted after the
  change is visible to readers.
*/

struct LoanOpened {
  LoanKey   key;
  Timestamp due_date = 0;
  Amount    deposit  = 0;
};

struct LoanExtended {
  LoanKey       key;
  Timestamp     due_date        = 0;
  std::uint32_t extensions_used = 0;
};

struct LoanClosed {
  LoanKey   key;
  Timestamp returned_at = 0;
  bool      late        = false;
};

struct DepositRefunded {
  LoanKey key;
  Amount  amount = 0;
};

// Once pooled the amount is no longer attributed to the loan.
struct DepositForfeited {
  LoanKey key;
  Amount  amount       = 0;
  Amount  pool_balance = 0;
};

struct PoolWithdrawn {
  AccountId to;
  Amount    amount       = 0;
  Amount    pool_balance = 0;
};

struct PolicyChanged {
  PolicyParameter parameter;
  std::uint64_t   old_value = 0;
  std::uint64_t   new_value = 0;
};

struct CustodianChanged {
  AccountId old_custodian;
  AccountId new_custodian;
};

struct StewardTransferred {
  AccountId old_steward;
  AccountId new_steward;
};

struct StewardRenounced {
  AccountId old_steward;
};

struct CuratorChanged {
  AccountId account;
  bool      granted = false;
};

struct MembershipChanged {
  AccountId                    account;
  bool                         granted = false;
  std::optional<std::uint32_t> tier;
};

struct ItemCreated {
  ItemId      item_id = 0;
  std::string title;
};

struct ItemUpdated {
  ItemId    item_id = 0;
  AccountId editor;
};

struct ItemPauseChanged {
  ItemId item_id = 0;
  bool   paused  = false;
};

struct UnitsMinted {
  ItemId        item_id = 0;
  AccountId     custodian;
  std::uint64_t quantity = 0;
};

using LedgerEvent = std::variant<LoanOpened, LoanExtended, LoanClosed, DepositRefunded, DepositForfeited, PoolWithdrawn, PolicyChanged,
                                 CustodianChanged, StewardTransferred, StewardRenounced, CuratorChanged, MembershipChanged, ItemCreated,
                                 ItemUpdated, ItemPauseChanged, UnitsMinted>;

const char* EventName(const LedgerEvent& event);

} // namespace lending::model
