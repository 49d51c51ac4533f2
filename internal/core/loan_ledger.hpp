#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "internal/model/events.hpp"
#include "internal/model/loan.hpp"
#include "internal/model/types.hpp"

namespace lending::catalog {
class Catalog;
}
namespace lending::escrow {
class EscrowVault;
}
namespace lending::events {
class EventSink;
}
namespace lending::funds {
class FundsSink;
}
namespace lending::inventory {
class InventoryLedger;
}
namespace lending::membership {
class MembershipOracle;
}
namespace lending::policy {
class PolicyStore;
}
namespace lending::util {
class Clock;
}

namespace lending::core {

struct LedgerCollaborators {
  std::shared_ptr<lending::policy::PolicyStore>         policy;
  std::shared_ptr<lending::catalog::Catalog>            catalog;
  std::shared_ptr<lending::inventory::InventoryLedger>  inventory;
  std::shared_ptr<lending::membership::MembershipOracle> membership;
  std::shared_ptr<lending::escrow::EscrowVault>         escrow;
  std::shared_ptr<lending::funds::FundsSink>            funds;
  std::shared_ptr<lending::events::EventSink>           events;
  std::shared_ptr<lending::util::Clock>                 clock;
};

struct ExtensionResult {
  lending::model::Timestamp due_date        = 0;
  std::uint32_t             extensions_used = 0;
};

/*
  Loan lifecycle per (borrower, item) key.

  Borrow, ReturnItem and RequestExtension on the same key are serialized by a
  per-key mutex; different keys run concurrently. Each transition either
  applies all of its effects or none:

  - Preconditions are checked against collaborators before any mutation.
  - Ledger, unit and escrow changes are applied under the key lock with a
    compensating step recorded for each.
  - Value transfers through the FundsSink run last, after the key lock is
    released, so a re-entrant sink only observes committed state. A failed
    transfer restores the pre-operation state before the error propagates.
  - An on-time return marks the loan as returning and pays the refund before
    the unit and escrow move. Until the payout settles the key rejects every
    other transition, so a failed refund only has to clear the mark.
*/
class LoanLedger {
 public:
  explicit LoanLedger(LedgerCollaborators collaborators);

  lending::model::Timestamp Borrow(const lending::model::AccountId& borrower, lending::model::ItemId item_id, lending::model::Amount paid_deposit);
  lending::model::Timestamp Borrow(const lending::model::AccountId& borrower, lending::model::ItemId item_id, lending::model::Amount paid_deposit,
                                   lending::model::Timestamp now);

  // Returns true when the item came back after due date plus grace period.
  bool ReturnItem(const lending::model::AccountId& borrower, lending::model::ItemId item_id);
  bool ReturnItem(const lending::model::AccountId& borrower, lending::model::ItemId item_id, lending::model::Timestamp now);

  ExtensionResult RequestExtension(const lending::model::AccountId& borrower, lending::model::ItemId item_id);
  ExtensionResult RequestExtension(const lending::model::AccountId& borrower, lending::model::ItemId item_id, lending::model::Timestamp now);

  // Steward-only. Credits `quantity` units of an existing item to the current custodian.
  void MintUnits(const lending::model::AccountId& caller, lending::model::ItemId item_id, std::uint64_t quantity);

  // Zero when no loan is open for the key.
  lending::model::Timestamp LoanDueDate(const lending::model::AccountId& borrower, lending::model::ItemId item_id) const;
  lending::model::Amount    LoanDeposit(const lending::model::AccountId& borrower, lending::model::ItemId item_id) const;

  std::optional<lending::model::Loan> GetLoan(const lending::model::AccountId& borrower, lending::model::ItemId item_id) const;

  std::vector<std::pair<lending::model::LoanKey, lending::model::Loan>> LoansOf(const lending::model::AccountId& borrower) const;

  std::size_t ActiveLoanCount() const;
  std::size_t ReturningCount() const;

  // Loans that would be late if returned at `now`.
  std::size_t OverdueCount(lending::model::Timestamp now) const;

  static bool IsLate(const lending::model::Loan& loan, lending::util::Seconds grace_period, lending::model::Timestamp now);

  // Keys with an operation in flight.
  std::size_t LockedKeyCount() const;

 private:
  // Holds the key's mutex for one operation. The map entry is dropped when
  // the last holder lets go, so the map only tracks keys in use.
  class KeyMutexRef {
   public:
    KeyMutexRef(LoanLedger& ledger, lending::model::LoanKey key);
    ~KeyMutexRef();

    KeyMutexRef(const KeyMutexRef&)            = delete;
    KeyMutexRef& operator=(const KeyMutexRef&) = delete;

    std::mutex& operator*() const {
      return *mutex_;
    }

   private:
    LoanLedger&                 ledger_;
    lending::model::LoanKey     key_;
    std::shared_ptr<std::mutex> mutex_;
  };

  std::shared_ptr<std::mutex> KeyMutex(const lending::model::LoanKey& key);
  void                        ReleaseKeyMutex(const lending::model::LoanKey& key, std::shared_ptr<std::mutex>& key_mutex);

  std::optional<lending::model::Loan> FindLoan(const lending::model::LoanKey& key) const;
  void                                PutLoan(const lending::model::LoanKey& key, const lending::model::Loan& loan);
  void                                EraseLoan(const lending::model::LoanKey& key);

  void Publish(const lending::model::LedgerEvent& event);

  LedgerCollaborators deps_;

  mutable std::shared_mutex                                                               loans_mutex_;
  std::unordered_map<lending::model::LoanKey, lending::model::Loan, lending::model::LoanKeyHash> loans_;

  mutable std::mutex                                                                                key_mutexes_guard_;
  std::unordered_map<lending::model::LoanKey, std::shared_ptr<std::mutex>, lending::model::LoanKeyHash> key_mutexes_;
};

} // namespace lending::core
