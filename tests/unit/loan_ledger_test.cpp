#include <atomic>
#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/catalog/catalog.hpp"
#include "internal/core/loan_ledger.hpp"
#include "internal/escrow/escrow_vault.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/funds/memory_funds_sink.hpp"
#include "internal/inventory/memory_inventory_ledger.hpp"
#include "internal/membership/memory_membership_oracle.hpp"
#include "internal/policy/policy_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using lending::model::ItemId;
using lending::util::ErrorReason;

constexpr lending::model::Timestamp kStart     = 1'700'000'000;
constexpr const char*               kSteward   = "steward";
constexpr const char*               kCustodian = "branch";
constexpr const char*               kAlice     = "alice";
constexpr const char*               kBob       = "bob";

// Pays out through a MemoryFundsSink unless told to fail.
class FlakyFundsSink final : public lending::funds::FundsSink {
public:
  void Received(lending::model::Amount amount) override {
    if (fail_received) throw std::runtime_error("funds sink offline");
    inner.Received(amount);
  }

  void PayOut(const lending::model::AccountId& to, lending::model::Amount amount) override {
    if (on_payout) on_payout(to);
    if (fail_payouts) throw std::runtime_error("payout rejected by bank");
    inner.PayOut(to, amount);
  }

  lending::model::Amount Balance() const override {
    return inner.Balance();
  }

  lending::funds::MemoryFundsSink                         inner{0};
  std::atomic<bool>                                       fail_payouts{false};
  std::atomic<bool>                                       fail_received{false};
  std::function<void(const lending::model::AccountId& to)> on_payout;
};

lending::model::LendingPolicy TestPolicy() {
  lending::model::LendingPolicy policy;
  policy.loan_duration      = 100;
  policy.deposit_amount     = 10;
  policy.grace_period       = 0;
  policy.extension_duration = 50;
  policy.max_extensions     = 2;
  return policy;
}

struct Harness {
  std::shared_ptr<lending::util::ManualClock>               clock;
  std::shared_ptr<lending::events::RecordingEventSink>      events;
  std::shared_ptr<lending::policy::PolicyStore>             policy;
  std::shared_ptr<lending::catalog::Catalog>                catalog;
  std::shared_ptr<lending::inventory::MemoryInventoryLedger> inventory;
  std::shared_ptr<lending::membership::MemoryMembershipOracle> membership;
  std::shared_ptr<lending::funds::FundsSink>                funds;
  std::shared_ptr<lending::escrow::EscrowVault>             escrow;
  std::shared_ptr<lending::core::LoanLedger>                ledger;
  ItemId                                                    item = 0;

  lending::funds::MemoryFundsSink& memory_funds() {
    if (auto* flaky = dynamic_cast<FlakyFundsSink*>(funds.get())) return flaky->inner;
    return dynamic_cast<lending::funds::MemoryFundsSink&>(*funds);
  }
};

Harness MakeHarness(lending::model::LendingPolicy terms = TestPolicy(), std::shared_ptr<lending::funds::FundsSink> funds = nullptr,
                    std::uint64_t units = 1, const std::string& custodian = kCustodian) {
  Harness h;
  h.clock      = std::make_shared<lending::util::ManualClock>(kStart);
  h.events     = std::make_shared<lending::events::RecordingEventSink>();
  h.policy     = std::make_shared<lending::policy::PolicyStore>(terms, custodian, lending::policy::PolicyStore::Roles{kSteward, {}}, h.events);
  h.catalog    = std::make_shared<lending::catalog::Catalog>(h.events);
  h.inventory  = std::make_shared<lending::inventory::MemoryInventoryLedger>();
  h.membership = std::make_shared<lending::membership::MemoryMembershipOracle>();
  h.funds      = funds ? funds : std::make_shared<lending::funds::MemoryFundsSink>(0);
  h.escrow     = std::make_shared<lending::escrow::EscrowVault>(h.funds, h.events);

  lending::core::LedgerCollaborators deps;
  deps.policy     = h.policy;
  deps.catalog    = h.catalog;
  deps.inventory  = h.inventory;
  deps.membership = h.membership;
  deps.escrow     = h.escrow;
  deps.funds      = h.funds;
  deps.events     = h.events;
  deps.clock      = h.clock;
  h.ledger        = std::make_shared<lending::core::LoanLedger>(deps);

  lending::model::ItemMetadata metadata;
  metadata.title  = "Structure and Interpretation of Computer Programs";
  metadata.author = "Abelson, Sussman";
  h.item          = h.catalog->CreateItem(h.policy->Access(), kSteward, metadata);
  if (units > 0) {
    h.inventory->Mint(custodian, h.item, units);
  }

  h.membership->Grant(kAlice);
  h.membership->Grant(kBob, 2);
  h.events->Clear();
  return h;
}

template <typename Error, typename Fn>
void ExpectError(ErrorReason reason, Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const Error& e) {
    threw = true;
    assert(e.Reason() == reason);
  }
  assert(threw && "expected a lending error");
}

void TestDueDateIsZeroBeforeBorrowAndAfterReturn() {
  auto h = MakeHarness();

  assert(h.ledger->LoanDueDate(kAlice, h.item) == 0);
  assert(h.ledger->LoanDeposit(kAlice, h.item) == 0);
  assert(!h.ledger->GetLoan(kAlice, h.item).has_value());

  const auto due = h.ledger->Borrow(kAlice, h.item, 10);
  assert(due == kStart + 100);
  assert(h.ledger->LoanDueDate(kAlice, h.item) == due);
  assert(h.ledger->LoanDeposit(kAlice, h.item) == 10);
  assert(h.inventory->BalanceOf(kAlice, h.item) == 1);
  assert(h.inventory->BalanceOf(kCustodian, h.item) == 0);
  assert(h.escrow->Escrowed({kAlice, h.item}) == 10);
  assert(h.funds->Balance() == 10);

  h.clock->Advance(10);
  assert(!h.ledger->ReturnItem(kAlice, h.item));

  assert(h.ledger->LoanDueDate(kAlice, h.item) == 0);
  assert(h.ledger->LoanDeposit(kAlice, h.item) == 0);
  assert(h.ledger->ActiveLoanCount() == 0);
  assert(h.inventory->BalanceOf(kCustodian, h.item) == 1);
}

void TestReturnAtDueDateIsOnTime() {
  auto       h   = MakeHarness();
  const auto due = h.ledger->Borrow(kAlice, h.item, 10, kStart);

  const bool late = h.ledger->ReturnItem(kAlice, h.item, due);
  assert(!late);
  assert(h.memory_funds().PaidTo(kAlice) == 10);
  assert(h.escrow->PoolBalance() == 0);
  assert(h.funds->Balance() == 0);

  const auto refunds = h.events->EventsOf<lending::model::DepositRefunded>();
  assert(refunds.size() == 1);
  assert(refunds[0].amount == 10);
}

void TestLateReturnForfeitsDeposit() {
  auto       h   = MakeHarness();
  const auto due = h.ledger->Borrow(kAlice, h.item, 10, kStart);

  const bool late = h.ledger->ReturnItem(kAlice, h.item, due + 1);
  assert(late);
  assert(h.memory_funds().PaidTo(kAlice) == 0);
  assert(h.escrow->PoolBalance() == 10);
  assert(h.escrow->TotalEscrowed() == 0);
  assert(h.funds->Balance() == 10);
  assert(h.inventory->BalanceOf(kCustodian, h.item) == 1);

  const auto closed = h.events->EventsOf<lending::model::LoanClosed>();
  assert(closed.size() == 1 && closed[0].late);
  const auto forfeited = h.events->EventsOf<lending::model::DepositForfeited>();
  assert(forfeited.size() == 1);
  assert(forfeited[0].amount == 10 && forfeited[0].pool_balance == 10);
  assert(h.events->EventsOf<lending::model::DepositRefunded>().empty());
}

void TestGracePeriodBoundaryAfterExtension() {
  auto terms         = TestPolicy();
  terms.grace_period = 5;
  auto h             = MakeHarness(terms);

  const auto due      = h.ledger->Borrow(kAlice, h.item, 10, kStart);
  const auto extended = h.ledger->RequestExtension(kAlice, h.item, kStart + 20);
  assert(extended.due_date == due + 50);
  assert(extended.extensions_used == 1);
  assert(h.ledger->GetLoan(kAlice, h.item)->extensions_used == 1);

  const bool late = h.ledger->ReturnItem(kAlice, h.item, extended.due_date + 5);
  assert(!late);
  assert(h.memory_funds().PaidTo(kAlice) == 10);
}

void TestLateOneSecondAfterGrace() {
  auto terms         = TestPolicy();
  terms.grace_period = 5;
  auto h             = MakeHarness(terms);

  const auto due = h.ledger->Borrow(kAlice, h.item, 10, kStart);
  assert(h.ledger->ReturnItem(kAlice, h.item, due + 6));
  assert(h.escrow->PoolBalance() == 10);
}

void TestExtensionAfterDueDateIsRejected() {
  auto       h   = MakeHarness();
  const auto due = h.ledger->Borrow(kAlice, h.item, 10, kStart);

  ExpectError<lending::util::StateConflict>(ErrorReason::kNoActiveLoan, [&] { h.ledger->RequestExtension(kAlice, h.item, due + 1); });
  assert(h.ledger->LoanDueDate(kAlice, h.item) == due);
  assert(h.ledger->GetLoan(kAlice, h.item)->extensions_used == 0);

  // Exactly at the due date the loan is still extendable.
  const auto extended = h.ledger->RequestExtension(kAlice, h.item, due);
  assert(extended.due_date == due + 50);
}

void TestExtensionWithoutLoan() {
  auto h = MakeHarness();
  ExpectError<lending::util::StateConflict>(ErrorReason::kNoActiveLoan, [&] { h.ledger->RequestExtension(kAlice, h.item, kStart); });
}

void TestMaxExtensionsReached() {
  auto h = MakeHarness();
  h.ledger->Borrow(kAlice, h.item, 10, kStart);

  assert(h.ledger->RequestExtension(kAlice, h.item, kStart + 1).extensions_used == 1);
  assert(h.ledger->RequestExtension(kAlice, h.item, kStart + 2).extensions_used == 2);
  const auto due = h.ledger->LoanDueDate(kAlice, h.item);
  assert(due == kStart + 200);

  ExpectError<lending::util::StateConflict>(ErrorReason::kMaxExtensionsReached,
                                            [&] { h.ledger->RequestExtension(kAlice, h.item, kStart + 3); });
  assert(h.ledger->LoanDueDate(kAlice, h.item) == due);
  assert(h.events->EventsOf<lending::model::LoanExtended>().size() == 2);
}

void TestZeroMaxExtensionsDisablesExtension() {
  auto terms           = TestPolicy();
  terms.max_extensions = 0;
  auto h               = MakeHarness(terms);
  h.ledger->Borrow(kAlice, h.item, 10, kStart);

  ExpectError<lending::util::StateConflict>(ErrorReason::kMaxExtensionsReached, [&] { h.ledger->RequestExtension(kAlice, h.item, kStart); });
}

void TestSecondReturnFails() {
  auto h = MakeHarness();
  h.ledger->Borrow(kAlice, h.item, 10, kStart);
  h.ledger->ReturnItem(kAlice, h.item, kStart + 1);

  ExpectError<lending::util::NotFound>(ErrorReason::kNoSuchLoan, [&] { h.ledger->ReturnItem(kAlice, h.item, kStart + 2); });
  assert(h.memory_funds().PaidTo(kAlice) == 10);
}

void TestSurplusDepositRefundedInFull() {
  auto h = MakeHarness();
  h.ledger->Borrow(kAlice, h.item, 25, kStart);
  assert(h.ledger->LoanDeposit(kAlice, h.item) == 25);
  assert(h.escrow->Escrowed({kAlice, h.item}) == 25);

  assert(!h.ledger->ReturnItem(kAlice, h.item, kStart + 50));
  assert(h.memory_funds().PaidTo(kAlice) == 25);
  assert(h.funds->Balance() == 0);
}

void TestDepositCapturedAtBorrowTime() {
  auto h = MakeHarness();
  h.ledger->Borrow(kAlice, h.item, 10, kStart);

  h.policy->SetDepositAmount(kSteward, 40);
  assert(h.ledger->LoanDeposit(kAlice, h.item) == 10);

  assert(!h.ledger->ReturnItem(kAlice, h.item, kStart + 1));
  assert(h.memory_funds().PaidTo(kAlice) == 10);

  ExpectError<lending::util::InvalidValue>(ErrorReason::kDepositTooLow, [&] { h.ledger->Borrow(kAlice, h.item, 10, kStart + 2); });
}

void TestBorrowPreconditionOrder() {
  auto h = MakeHarness();
  h.catalog->SetPaused(h.policy->Access(), kSteward, h.item, true);

  // Non-member wins over every later failure.
  ExpectError<lending::util::Unauthorized>(ErrorReason::kNotMember, [&] { h.ledger->Borrow("mallory", 999, 0, kStart); });
  ExpectError<lending::util::NotFound>(ErrorReason::kNoSuchItem, [&] { h.ledger->Borrow(kAlice, 999, 0, kStart); });
  ExpectError<lending::util::StateConflict>(ErrorReason::kItemPaused, [&] { h.ledger->Borrow(kAlice, h.item, 0, kStart); });

  h.catalog->SetPaused(h.policy->Access(), kSteward, h.item, false);
  ExpectError<lending::util::InvalidValue>(ErrorReason::kDepositTooLow, [&] { h.ledger->Borrow(kAlice, h.item, 9, kStart); });

  h.ledger->Borrow(kAlice, h.item, 10, kStart);
  ExpectError<lending::util::StateConflict>(ErrorReason::kActiveLoanExists, [&] { h.ledger->Borrow(kAlice, h.item, 0, kStart); });

  // The only unit is out on loan.
  ExpectError<lending::util::ResourceExhausted>(ErrorReason::kUnavailable, [&] { h.ledger->Borrow(kBob, h.item, 10, kStart); });

  assert(h.ledger->ActiveLoanCount() == 1);
  assert(h.escrow->TotalEscrowed() == 10);
  assert(h.funds->Balance() == 10);
  assert(h.events->EventsOf<lending::model::LoanOpened>().size() == 1);
}

void TestBorrowWithoutCustodian() {
  auto h = MakeHarness(TestPolicy(), nullptr, 0, "");
  ExpectError<lending::util::InvalidValue>(ErrorReason::kBranchUnset, [&] { h.ledger->Borrow(kAlice, h.item, 10, kStart); });

  h.policy->SetCustodian(kSteward, kCustodian);
  ExpectError<lending::util::ResourceExhausted>(ErrorReason::kUnavailable, [&] { h.ledger->Borrow(kAlice, h.item, 10, kStart); });

  h.ledger->MintUnits(kSteward, h.item, 2);
  assert(h.inventory->BalanceOf(kCustodian, h.item) == 2);
  h.ledger->Borrow(kAlice, h.item, 10, kStart);
}

void TestReturnGoesToRecordedCustodian() {
  auto h = MakeHarness();
  h.ledger->Borrow(kAlice, h.item, 10, kStart);

  h.policy->SetCustodian(kSteward, "east-branch");
  assert(!h.ledger->ReturnItem(kAlice, h.item, kStart + 1));
  assert(h.inventory->BalanceOf(kCustodian, h.item) == 1);
  assert(h.inventory->BalanceOf("east-branch", h.item) == 0);
}

void TestReturnRequiresHolder() {
  auto h = MakeHarness();
  h.ledger->Borrow(kAlice, h.item, 10, kStart);
  h.inventory->Transfer(kAlice, kBob, h.item, 1);

  ExpectError<lending::util::StateConflict>(ErrorReason::kNotHolder, [&] { h.ledger->ReturnItem(kAlice, h.item, kStart + 1); });
  assert(h.ledger->GetLoan(kAlice, h.item).has_value());
  assert(h.escrow->Escrowed({kAlice, h.item}) == 10);
}

void TestRefundFailureRestoresLoan() {
  auto flaky = std::make_shared<FlakyFundsSink>();
  auto h     = MakeHarness(TestPolicy(), flaky);

  const auto due = h.ledger->Borrow(kAlice, h.item, 10, kStart);
  flaky->fail_payouts = true;

  bool threw = false;
  try {
    h.ledger->ReturnItem(kAlice, h.item, kStart + 1);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  const auto loan = h.ledger->GetLoan(kAlice, h.item);
  assert(loan.has_value());
  assert(loan->due_date == due && loan->deposit == 10);
  assert(h.escrow->Escrowed({kAlice, h.item}) == 10);
  assert(h.escrow->TotalEscrowed() == 10);
  assert(h.inventory->BalanceOf(kAlice, h.item) == 1);
  assert(h.inventory->BalanceOf(kCustodian, h.item) == 0);
  assert(h.events->EventsOf<lending::model::LoanClosed>().empty());

  flaky->fail_payouts = false;
  assert(!h.ledger->ReturnItem(kAlice, h.item, kStart + 2));
  assert(flaky->inner.PaidTo(kAlice) == 10);
  assert(h.ledger->ActiveLoanCount() == 0);
}

template <typename Fn>
std::optional<ErrorReason> ReasonOf(Fn&& fn) {
  try {
    fn();
  } catch (const lending::util::LendingError& e) {
    return e.Reason();
  }
  return std::nullopt;
}

void TestRefundFailureWhileKeyIsContended() {
  auto flaky = std::make_shared<FlakyFundsSink>();
  auto h     = MakeHarness(TestPolicy(), flaky);

  const auto due = h.ledger->Borrow(kAlice, h.item, 10, kStart);

  // The bank calls back into the ledger and then rejects the refund.
  bool                       rejecting = true;
  std::optional<ErrorReason> borrow_during_refund;
  std::optional<ErrorReason> return_during_refund;
  std::optional<ErrorReason> extend_during_refund;
  flaky->on_payout = [&](const lending::model::AccountId& to) {
    if (!rejecting || to != kAlice) return;
    borrow_during_refund = ReasonOf([&] { h.ledger->Borrow(kBob, h.item, 10, kStart + 1); });
    return_during_refund = ReasonOf([&] { h.ledger->ReturnItem(kAlice, h.item, kStart + 1); });
    extend_during_refund = ReasonOf([&] { h.ledger->RequestExtension(kAlice, h.item, kStart + 1); });

    // Unit and deposit stay with the loan until the refund settles.
    assert(h.inventory->BalanceOf(kAlice, h.item) == 1);
    assert(h.inventory->BalanceOf(kCustodian, h.item) == 0);
    assert(h.escrow->Escrowed({kAlice, h.item}) == 10);
    assert(h.ledger->ReturningCount() == 1);
    throw std::runtime_error("payout rejected by bank");
  };

  bool threw = false;
  try {
    h.ledger->ReturnItem(kAlice, h.item, kStart + 1);
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "payout rejected by bank";
  }
  assert(threw);

  assert(borrow_during_refund == ErrorReason::kUnavailable);
  assert(return_during_refund == ErrorReason::kNoSuchLoan);
  assert(extend_during_refund == ErrorReason::kNoActiveLoan);

  const auto loan = h.ledger->GetLoan(kAlice, h.item);
  assert(loan.has_value());
  assert(!loan->returning);
  assert(h.ledger->ReturningCount() == 0);
  assert(loan->due_date == due && loan->deposit == 10);
  assert(!h.ledger->GetLoan(kBob, h.item).has_value());
  assert(h.inventory->BalanceOf(kAlice, h.item) == 1);
  assert(h.inventory->BalanceOf(kBob, h.item) == 0);
  assert(h.inventory->BalanceOf(kCustodian, h.item) == 0);
  assert(h.escrow->Escrowed({kAlice, h.item}) == 10);
  assert(h.ledger->LockedKeyCount() == 0);
  assert(h.events->EventsOf<lending::model::LoanClosed>().empty());

  // The borrower can still return, and the unit circulates again afterwards.
  rejecting = false;
  assert(!h.ledger->ReturnItem(kAlice, h.item, kStart + 2));
  assert(flaky->inner.PaidTo(kAlice) == 10);
  assert(h.inventory->BalanceOf(kCustodian, h.item) == 1);
  assert(h.escrow->TotalEscrowed() == 0);
  h.ledger->Borrow(kBob, h.item, 10, kStart + 3);
  assert(h.inventory->BalanceOf(kBob, h.item) == 1);
}

void TestKeyMutexesDoNotOutliveOperations() {
  auto h = MakeHarness();

  for (int i = 0; i < 64; ++i) {
    const auto stranger = "stranger-" + std::to_string(i);
    ExpectError<lending::util::Unauthorized>(ErrorReason::kNotMember, [&] { h.ledger->Borrow(stranger, h.item, 10, kStart); });
    ExpectError<lending::util::NotFound>(ErrorReason::kNoSuchItem, [&] { h.ledger->Borrow(kAlice, 1000 + i, 10, kStart); });
    ExpectError<lending::util::NotFound>(ErrorReason::kNoSuchLoan, [&] { h.ledger->ReturnItem(stranger, 1000 + i, kStart); });
    ExpectError<lending::util::StateConflict>(ErrorReason::kNoActiveLoan, [&] { h.ledger->RequestExtension(stranger, h.item, kStart); });
  }
  assert(h.ledger->LockedKeyCount() == 0);

  h.ledger->Borrow(kAlice, h.item, 10, kStart);
  h.ledger->RequestExtension(kAlice, h.item, kStart + 1);
  assert(h.ledger->LockedKeyCount() == 0);
  assert(!h.ledger->ReturnItem(kAlice, h.item, kStart + 2));
  assert(h.ledger->LockedKeyCount() == 0);
}

void TestDepositCreditFailureRollsBackBorrow() {
  auto flaky           = std::make_shared<FlakyFundsSink>();
  auto h               = MakeHarness(TestPolicy(), flaky);
  flaky->fail_received = true;

  bool threw = false;
  try {
    h.ledger->Borrow(kAlice, h.item, 10, kStart);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(h.ledger->ActiveLoanCount() == 0);
  assert(h.escrow->TotalEscrowed() == 0);
  assert(h.inventory->BalanceOf(kCustodian, h.item) == 1);
  assert(h.events->EventsOf<lending::model::LoanOpened>().empty());
}

void TestOverdueCount() {
  auto h = MakeHarness(TestPolicy(), nullptr, 3);
  h.ledger->Borrow(kAlice, h.item, 10, kStart);
  h.ledger->Borrow(kBob, h.item, 10, kStart + 50);

  assert(h.ledger->OverdueCount(kStart + 100) == 0);
  assert(h.ledger->OverdueCount(kStart + 101) == 1);
  assert(h.ledger->OverdueCount(kStart + 151) == 2);
  assert(h.ledger->LoansOf(kAlice).size() == 1);
}

void TestConcurrentBorrowersShareUnits() {
  constexpr int kBorrowers = 16;
  auto          h          = MakeHarness(TestPolicy(), nullptr, 4);
  for (int i = 0; i < kBorrowers; ++i) {
    h.membership->Grant("reader-" + std::to_string(i));
  }

  std::atomic<int>         granted{0};
  std::atomic<int>         unavailable{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kBorrowers; ++i) {
    threads.emplace_back([&, i] {
      try {
        h.ledger->Borrow("reader-" + std::to_string(i), h.item, 10, kStart);
        granted.fetch_add(1);
      } catch (const lending::util::ResourceExhausted& e) {
        assert(e.Reason() == ErrorReason::kUnavailable);
        unavailable.fetch_add(1);
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(granted.load() == 4);
  assert(unavailable.load() == kBorrowers - 4);
  assert(h.ledger->ActiveLoanCount() == 4);
  assert(h.escrow->TotalEscrowed() == 40);
  assert(h.inventory->BalanceOf(kCustodian, h.item) == 0);
  assert(h.ledger->LockedKeyCount() == 0);
}

void TestMintUnitsRequiresSteward() {
  auto h = MakeHarness();
  ExpectError<lending::util::Unauthorized>(ErrorReason::kNotSteward, [&] { h.ledger->MintUnits(kAlice, h.item, 1); });
  ExpectError<lending::util::NotFound>(ErrorReason::kNoSuchItem, [&] { h.ledger->MintUnits(kSteward, 42, 1); });
  ExpectError<lending::util::InvalidValue>(ErrorReason::kZeroAmount, [&] { h.ledger->MintUnits(kSteward, h.item, 0); });

  h.ledger->MintUnits(kSteward, h.item, 5);
  assert(h.inventory->BalanceOf(kCustodian, h.item) == 6);
  assert(h.inventory->TotalSupply(h.item) == 6);
  assert(h.events->EventsOf<lending::model::UnitsMinted>().size() == 1);
}

} // namespace

int main() {
  TestDueDateIsZeroBeforeBorrowAndAfterReturn();
  TestReturnAtDueDateIsOnTime();
  TestLateReturnForfeitsDeposit();
  TestGracePeriodBoundaryAfterExtension();
  TestLateOneSecondAfterGrace();
  TestExtensionAfterDueDateIsRejected();
  TestExtensionWithoutLoan();
  TestMaxExtensionsReached();
  TestZeroMaxExtensionsDisablesExtension();
  TestSecondReturnFails();
  TestSurplusDepositRefundedInFull();
  TestDepositCapturedAtBorrowTime();
  TestBorrowPreconditionOrder();
  TestBorrowWithoutCustodian();
  TestReturnGoesToRecordedCustodian();
  TestReturnRequiresHolder();
  TestRefundFailureRestoresLoan();
  TestRefundFailureWhileKeyIsContended();
  TestKeyMutexesDoNotOutliveOperations();
  TestDepositCreditFailureRollsBackBorrow();
  TestOverdueCount();
  TestConcurrentBorrowersShareUnits();
  TestMintUnitsRequiresSteward();

  std::cout << "lending_ledger_unit_loan_ledger: pass\n";
  return 0;
}
