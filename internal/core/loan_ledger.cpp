#include "loan_ledger.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "internal/catalog/catalog.hpp"
#include "internal/core/undo_log.hpp"
#include "internal/escrow/escrow_vault.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/funds/funds_sink.hpp"
#include "internal/inventory/inventory_ledger.hpp"
#include "internal/membership/membership_oracle.hpp"
#include "internal/model/loan_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/policy/policy_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace lending::core {

using lending::model::AccountId;
using lending::model::Amount;
using lending::model::ItemId;
using lending::model::Loan;
using lending::model::LoanKey;
using lending::model::LoanState;
using lending::model::Timestamp;
using lending::observability::StringField;
using lending::observability::UintField;
using lending::util::ErrorReason;

namespace {

bool SameLoan(const std::optional<Loan>& current, const Loan& expected) {
  return current.has_value() && !current->returning && current->due_date == expected.due_date && current->opened_at == expected.opened_at &&
         current->deposit == expected.deposit && current->extensions_used == expected.extensions_used;
}

std::string Describe(std::string_view action, const LoanKey& key) {
  return std::string(action) + " " + lending::model::ToString(key);
}

} // namespace

LoanLedger::LoanLedger(LedgerCollaborators collaborators) : deps_(std::move(collaborators)) {
  if (!deps_.policy || !deps_.catalog || !deps_.inventory || !deps_.membership || !deps_.escrow || !deps_.funds || !deps_.clock) {
    throw std::invalid_argument("loan ledger: every collaborator except the event sink is required");
  }
}

std::shared_ptr<std::mutex> LoanLedger::KeyMutex(const LoanKey& key) {
  std::lock_guard<std::mutex> lock(key_mutexes_guard_);
  auto&                       key_mutex = key_mutexes_[key];
  if (!key_mutex) {
    key_mutex = std::make_shared<std::mutex>();
  }
  return key_mutex;
}

void LoanLedger::ReleaseKeyMutex(const LoanKey& key, std::shared_ptr<std::mutex>& key_mutex) {
  std::lock_guard<std::mutex> lock(key_mutexes_guard_);
  key_mutex.reset();
  auto it = key_mutexes_.find(key);
  if (it != key_mutexes_.end() && it->second.use_count() == 1) {
    key_mutexes_.erase(it);
  }
}

std::size_t LoanLedger::LockedKeyCount() const {
  std::lock_guard<std::mutex> lock(key_mutexes_guard_);
  return key_mutexes_.size();
}

LoanLedger::KeyMutexRef::KeyMutexRef(LoanLedger& ledger, LoanKey key) : ledger_(ledger), key_(std::move(key)), mutex_(ledger.KeyMutex(key_)) {
}

LoanLedger::KeyMutexRef::~KeyMutexRef() {
  ledger_.ReleaseKeyMutex(key_, mutex_);
}

std::optional<Loan> LoanLedger::FindLoan(const LoanKey& key) const {
  std::shared_lock lock(loans_mutex_);
  auto             it = loans_.find(key);
  if (it == loans_.end()) return std::nullopt;
  return it->second;
}

void LoanLedger::PutLoan(const LoanKey& key, const Loan& loan) {
  std::unique_lock lock(loans_mutex_);
  loans_[key] = loan;
}

void LoanLedger::EraseLoan(const LoanKey& key) {
  std::unique_lock lock(loans_mutex_);
  loans_.erase(key);
}

bool LoanLedger::IsLate(const Loan& loan, lending::util::Seconds grace_period, Timestamp now) {
  // now > due_date + grace_period, without overflowing the sum.
  return now > loan.due_date && now - loan.due_date > grace_period;
}

// ---------------------------------------------------------------------------
// Borrow
// ---------------------------------------------------------------------------

Timestamp LoanLedger::Borrow(const AccountId& borrower, ItemId item_id, Amount paid_deposit) {
  return Borrow(borrower, item_id, paid_deposit, deps_.clock->Now());
}

Timestamp LoanLedger::Borrow(const AccountId& borrower, ItemId item_id, Amount paid_deposit, Timestamp now) {
  if (!deps_.membership->IsMember(borrower)) {
    throw lending::util::Unauthorized(ErrorReason::kNotMember, "borrow: " + borrower + " holds no membership");
  }

  const LoanKey key{borrower, item_id};
  UndoLog       undo(Describe("borrow", key));
  Loan          loan;

  KeyMutexRef key_mutex(*this, key);
  {
    std::lock_guard key_lock(*key_mutex);
    try {
      if (!deps_.catalog->Exists(item_id)) {
        throw lending::util::NotFound(ErrorReason::kNoSuchItem, "borrow: item " + std::to_string(item_id) + " does not exist");
      }
      const auto custodian = deps_.policy->Custodian();
      if (custodian.empty()) {
        throw lending::util::InvalidValue(ErrorReason::kBranchUnset, "borrow: no custodian is configured");
      }
      if (deps_.catalog->IsPaused(item_id)) {
        throw lending::util::StateConflict(ErrorReason::kItemPaused, "borrow: item " + std::to_string(item_id) + " is paused");
      }
      if (!lending::model::CanTransition(lending::model::StateOf(FindLoan(key)), LoanState::kBorrowed)) {
        throw lending::util::StateConflict(ErrorReason::kActiveLoanExists, Describe("borrow:", key) + " already has an active loan");
      }
      const auto policy = deps_.policy->Policy();
      if (paid_deposit < policy.deposit_amount) {
        throw lending::util::InvalidValue(ErrorReason::kDepositTooLow, "borrow: deposit " + std::to_string(paid_deposit) + " is below required " +
                                                                           std::to_string(policy.deposit_amount));
      }
      if (deps_.inventory->BalanceOf(custodian, item_id) == 0) {
        throw lending::util::ResourceExhausted(ErrorReason::kUnavailable, "borrow: no unit of item " + std::to_string(item_id) + " is available");
      }

      loan.custodian       = custodian;
      loan.opened_at       = now;
      loan.due_date        = now + policy.loan_duration;
      loan.deposit         = paid_deposit;
      loan.extensions_used = 0;

      try {
        deps_.inventory->Transfer(custodian, borrower, item_id, 1);
      } catch (const lending::util::ResourceExhausted& e) {
        // Another key took the last unit between the balance check and the transfer.
        throw lending::util::ResourceExhausted(ErrorReason::kUnavailable, std::string("borrow: ") + e.what());
      }
      undo.Add([this, custodian, borrower, item_id] { deps_.inventory->Transfer(borrower, custodian, item_id, 1); });

      deps_.escrow->Lock(key, paid_deposit);
      undo.Add([this, key] { deps_.escrow->Release(key); });

      PutLoan(key, loan);
      undo.Add([this, key] { EraseLoan(key); });
    } catch (...) {
      undo.Rollback();
      throw;
    }
  }

  try {
    deps_.funds->Received(paid_deposit);
  } catch (const std::exception& e) {
    std::lock_guard key_lock(*key_mutex);
    LENDING_LOG_ERROR("borrow deposit credit failed", {StringField("borrower", borrower), UintField("item_id", item_id), StringField("error", e.what())});
    if (SameLoan(FindLoan(key), loan)) {
      undo.Rollback();
    } else {
      undo.Commit();
      LENDING_LOG_ERROR("borrow rollback skipped: loan changed while crediting deposit",
                        {StringField("borrower", borrower), UintField("item_id", item_id)});
    }
    throw;
  }
  undo.Commit();

  Publish(lending::model::LoanOpened{key, loan.due_date, loan.deposit});
  return loan.due_date;
}

// ---------------------------------------------------------------------------
// Return
// ---------------------------------------------------------------------------

bool LoanLedger::ReturnItem(const AccountId& borrower, ItemId item_id) {
  return ReturnItem(borrower, item_id, deps_.clock->Now());
}

bool LoanLedger::ReturnItem(const AccountId& borrower, ItemId item_id, Timestamp now) {
  const LoanKey key{borrower, item_id};
  Loan          loan;
  bool          late   = false;
  Amount        amount = 0;

  KeyMutexRef key_mutex(*this, key);
  {
    std::lock_guard key_lock(*key_mutex);

    const auto found = FindLoan(key);
    if (!found.has_value()) {
      throw lending::util::NotFound(ErrorReason::kNoSuchLoan, Describe("return:", key) + " has no active loan");
    }
    if (!lending::model::CanTransition(lending::model::StateOf(found), LoanState::kReturning)) {
      throw lending::util::NotFound(ErrorReason::kNoSuchLoan, Describe("return:", key) + " is already being returned");
    }
    if (deps_.inventory->BalanceOf(borrower, item_id) == 0) {
      throw lending::util::StateConflict(ErrorReason::kNotHolder, "return: " + borrower + " does not hold a unit of item " + std::to_string(item_id));
    }
    loan = *found;
    late = IsLate(loan, deps_.policy->Policy().grace_period, now);

    if (late) {
      UndoLog undo(Describe("return", key));
      try {
        deps_.inventory->Transfer(borrower, loan.custodian, item_id, 1);
        undo.Add([this, custodian = loan.custodian, borrower, item_id] { deps_.inventory->Transfer(custodian, borrower, item_id, 1); });

        EraseLoan(key);
        undo.Add([this, key, loan] { PutLoan(key, loan); });

        amount = deps_.escrow->Forfeit(key);
      } catch (...) {
        undo.Rollback();
        throw;
      }
      undo.Commit();
    } else {
      amount = deps_.escrow->Escrowed(key);
      if (deps_.funds->Balance() < amount) {
        throw lending::util::ResourceExhausted(ErrorReason::kInsufficientFunds, "return: held funds do not cover the deposit refund for " +
                                                                                    lending::model::ToString(key));
      }
      Loan pending      = loan;
      pending.returning = true;
      PutLoan(key, pending);
    }
  }

  if (!late) {
    try {
      deps_.funds->PayOut(borrower, amount);
    } catch (const std::exception& e) {
      std::lock_guard key_lock(*key_mutex);
      LENDING_LOG_ERROR("deposit refund failed", {StringField("borrower", borrower), UintField("item_id", item_id), UintField("amount", amount),
                                                  StringField("error", e.what())});
      PutLoan(key, loan);
      throw;
    }

    std::lock_guard key_lock(*key_mutex);
    UndoLog         undo(Describe("settle return", key));
    try {
      deps_.inventory->Transfer(borrower, loan.custodian, item_id, 1);
      undo.Add([this, custodian = loan.custodian, borrower, item_id] { deps_.inventory->Transfer(custodian, borrower, item_id, 1); });
      deps_.escrow->Release(key);
      EraseLoan(key);
    } catch (const std::exception& e) {
      undo.Rollback();
      PutLoan(key, loan);
      LENDING_LOG_ERROR("return settlement failed after refund", {StringField("borrower", borrower), UintField("item_id", item_id),
                                                                  UintField("amount", amount), StringField("error", e.what())});
      throw;
    }
    undo.Commit();
  }

  Publish(lending::model::LoanClosed{key, now, late});
  if (late) {
    Publish(lending::model::DepositForfeited{key, amount, deps_.escrow->PoolBalance()});
  } else {
    Publish(lending::model::DepositRefunded{key, amount});
  }
  return late;
}

// ---------------------------------------------------------------------------
// Extension
// ---------------------------------------------------------------------------

ExtensionResult LoanLedger::RequestExtension(const AccountId& borrower, ItemId item_id) {
  return RequestExtension(borrower, item_id, deps_.clock->Now());
}

ExtensionResult LoanLedger::RequestExtension(const AccountId& borrower, ItemId item_id, Timestamp now) {
  const LoanKey   key{borrower, item_id};
  ExtensionResult result;
  KeyMutexRef     key_mutex(*this, key);
  {
    std::lock_guard key_lock(*key_mutex);

    auto found = FindLoan(key);
    if (!found.has_value()) {
      throw lending::util::StateConflict(ErrorReason::kNoActiveLoan, Describe("extend:", key) + " has no active loan");
    }
    if (!lending::model::CanTransition(lending::model::StateOf(found), LoanState::kExtended)) {
      throw lending::util::StateConflict(ErrorReason::kNoActiveLoan, Describe("extend:", key) + " is being returned");
    }
    if (now > found->due_date) {
      throw lending::util::StateConflict(ErrorReason::kNoActiveLoan, Describe("extend:", key) + " is past its due date");
    }
    const auto policy = deps_.policy->Policy();
    if (found->extensions_used >= policy.max_extensions) {
      throw lending::util::StateConflict(ErrorReason::kMaxExtensionsReached,
                                         Describe("extend:", key) + " already used " + std::to_string(found->extensions_used) + " of " +
                                             std::to_string(policy.max_extensions) + " extensions");
    }

    found->due_date += policy.extension_duration;
    found->extensions_used += 1;
    PutLoan(key, *found);

    result.due_date        = found->due_date;
    result.extensions_used = found->extensions_used;
  }

  Publish(lending::model::LoanExtended{key, result.due_date, result.extensions_used});
  return result;
}

// ---------------------------------------------------------------------------
// Units
// ---------------------------------------------------------------------------

void LoanLedger::MintUnits(const AccountId& caller, ItemId item_id, std::uint64_t quantity) {
  deps_.policy->Access().RequireSteward(caller, "mint units");
  if (!deps_.catalog->Exists(item_id)) {
    throw lending::util::NotFound(ErrorReason::kNoSuchItem, "mint units: item " + std::to_string(item_id) + " does not exist");
  }
  const auto custodian = deps_.policy->Custodian();
  if (custodian.empty()) {
    throw lending::util::InvalidValue(ErrorReason::kBranchUnset, "mint units: no custodian is configured");
  }
  if (quantity == 0) {
    throw lending::util::InvalidValue(ErrorReason::kZeroAmount, "mint units: quantity must be positive");
  }

  deps_.inventory->Mint(custodian, item_id, quantity);
  Publish(lending::model::UnitsMinted{item_id, custodian, quantity});
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

Timestamp LoanLedger::LoanDueDate(const AccountId& borrower, ItemId item_id) const {
  const auto loan = FindLoan({borrower, item_id});
  return loan.has_value() ? loan->due_date : 0;
}

Amount LoanLedger::LoanDeposit(const AccountId& borrower, ItemId item_id) const {
  const auto loan = FindLoan({borrower, item_id});
  return loan.has_value() ? loan->deposit : 0;
}

std::optional<Loan> LoanLedger::GetLoan(const AccountId& borrower, ItemId item_id) const {
  return FindLoan({borrower, item_id});
}

std::vector<std::pair<LoanKey, Loan>> LoanLedger::LoansOf(const AccountId& borrower) const {
  std::shared_lock                      lock(loans_mutex_);
  std::vector<std::pair<LoanKey, Loan>> out;
  for (const auto& [key, loan] : loans_) {
    if (key.borrower == borrower) out.emplace_back(key, loan);
  }
  return out;
}

std::size_t LoanLedger::ActiveLoanCount() const {
  std::shared_lock lock(loans_mutex_);
  return loans_.size();
}

std::size_t LoanLedger::ReturningCount() const {
  std::shared_lock lock(loans_mutex_);
  std::size_t      count = 0;
  for (const auto& [key, loan] : loans_) {
    if (loan.returning) ++count;
  }
  return count;
}

std::size_t LoanLedger::OverdueCount(Timestamp now) const {
  const auto       grace = deps_.policy->Policy().grace_period;
  std::shared_lock lock(loans_mutex_);
  std::size_t      count = 0;
  for (const auto& [key, loan] : loans_) {
    if (IsLate(loan, grace, now)) ++count;
  }
  return count;
}

void LoanLedger::Publish(const lending::model::LedgerEvent& event) {
  if (deps_.events) deps_.events->Publish(event);
}

} // namespace lending::core
