#include <cassert>
#include <iostream>
#include <memory>

#include "internal/config/config_loader.hpp"
#include "internal/escrow/escrow_vault.hpp"
#include "internal/factory.hpp"
#include "internal/membership/memory_membership_oracle.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/lending_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using lending::util::ErrorReason;

constexpr lending::util::Timestamp kStart = 1'700'000'000;

struct Fixture {
  std::shared_ptr<lending::util::ManualClock>       clock = std::make_shared<lending::util::ManualClock>(kStart);
  lending::factory::Application                     app;
  std::unique_ptr<lending::service::AdminService>   admin_service;
  std::unique_ptr<lending::service::LendingService> lending_service;
};

std::unique_ptr<Fixture> MakeFixture() {
  auto f = std::make_unique<Fixture>();

  const auto config = lending::config::ConfigLoader::LoadFromYamlString(R"(policy:
  loan_duration: "100s"
  deposit_amount: 10
stewardship:
  steward: "steward"
custodian: "branch"
members:
  - account: "alice"
catalog:
  - title: "Principia Mathematica"
    units: 1
)");
  f->app     = lending::factory::Build(config, f->clock);
  f->admin_service   = std::make_unique<lending::service::AdminService>(f->app.context);
  f->lending_service = std::make_unique<lending::service::LendingService>(f->app.context);
  return f;
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
  assert(threw);
}

void TestGetAndUpdatePolicy() {
  auto f = MakeFixture();

  auto policy = f->admin_service->GetPolicy({}).policy();
  assert(policy.loan_duration().seconds() == 100);
  assert(policy.deposit_amount() == 10);
  assert(policy.custodian() == "branch");
  assert(policy.steward() == "steward");

  lending::v1::UpdatePolicyRequest update;
  update.set_caller("steward");
  update.mutable_grace_period()->set_seconds(30);
  update.set_max_extensions(3);
  policy = f->admin_service->UpdatePolicy(update).policy();
  assert(policy.grace_period().seconds() == 30);
  assert(policy.max_extensions() == 3);
  assert(policy.loan_duration().seconds() == 100);

  // One invalid field rejects the whole update.
  lending::v1::UpdatePolicyRequest invalid;
  invalid.set_caller("steward");
  invalid.set_deposit_amount(50);
  invalid.mutable_extension_duration()->set_seconds(0);
  ExpectError<lending::util::InvalidValue>(ErrorReason::kZeroDuration, [&] { f->admin_service->UpdatePolicy(invalid); });
  assert(f->admin_service->GetPolicy({}).policy().deposit_amount() == 10);

  lending::v1::UpdatePolicyRequest intruder;
  intruder.set_caller("alice");
  intruder.set_deposit_amount(1);
  ExpectError<lending::util::Unauthorized>(ErrorReason::kNotSteward, [&] { f->admin_service->UpdatePolicy(intruder); });
}

void TestMembershipAdministration() {
  auto f = MakeFixture();

  lending::v1::MembershipRequest grant;
  grant.set_caller("steward");
  grant.set_account("carol");
  grant.set_tier(4);
  f->admin_service->GrantMembership(grant);
  assert(f->app.context.membership->IsMember("carol"));
  assert(f->app.context.membership->Tier("carol").value() == 4);

  lending::v1::BorrowRequest borrow;
  borrow.set_borrower("carol");
  borrow.set_item_id(1);
  borrow.set_sent_value(10);
  f->lending_service->Borrow(borrow);

  lending::v1::MembershipRequest revoke;
  revoke.set_caller("steward");
  revoke.set_account("carol");
  f->admin_service->RevokeMembership(revoke);
  assert(!f->app.context.membership->IsMember("carol"));

  // Revoking membership does not cancel an open loan.
  lending::v1::ReturnItemRequest give_back;
  give_back.set_borrower("carol");
  give_back.set_item_id(1);
  assert(!f->lending_service->ReturnItem(give_back).late());

  grant.set_caller("alice");
  ExpectError<lending::util::Unauthorized>(ErrorReason::kNotSteward, [&] { f->admin_service->GrantMembership(grant); });
}

void TestWithdrawForfeits() {
  auto f = MakeFixture();

  lending::v1::BorrowRequest borrow;
  borrow.set_borrower("alice");
  borrow.set_item_id(1);
  borrow.set_sent_value(15);
  f->lending_service->Borrow(borrow);

  f->clock->Advance(101);
  lending::v1::ReturnItemRequest give_back;
  give_back.set_borrower("alice");
  give_back.set_item_id(1);
  assert(f->lending_service->ReturnItem(give_back).late());
  assert(f->app.context.escrow->PoolBalance() == 15);

  lending::v1::WithdrawForfeitsRequest withdraw;
  withdraw.set_caller("steward");
  withdraw.set_to("treasury");
  withdraw.set_amount(6);
  assert(f->admin_service->WithdrawForfeits(withdraw).pool_balance() == 9);

  withdraw.set_amount(10);
  ExpectError<lending::util::ResourceExhausted>(ErrorReason::kInsufficientPool, [&] { f->admin_service->WithdrawForfeits(withdraw); });
}

void TestRenouncedStewardshipLocksAdministration() {
  auto f = MakeFixture();

  lending::v1::CuratorRequest curator;
  curator.set_caller("steward");
  curator.set_account("archivist");
  assert(f->admin_service->GrantCurator(curator).policy().curators_size() == 1);

  lending::v1::TransferStewardshipRequest transfer;
  transfer.set_caller("steward");
  transfer.set_new_steward("trustee");
  assert(f->admin_service->TransferStewardship(transfer).policy().steward() == "trustee");

  lending::v1::RenounceStewardshipRequest renounce;
  renounce.set_caller("trustee");
  assert(f->admin_service->RenounceStewardship(renounce).policy().steward().empty());

  lending::v1::SetCustodianRequest custodian;
  custodian.set_caller("trustee");
  custodian.set_custodian("east-branch");
  ExpectError<lending::util::Unauthorized>(ErrorReason::kNotSteward, [&] { f->admin_service->SetCustodian(custodian); });
  ExpectError<lending::util::Unauthorized>(ErrorReason::kNotSteward, [&] { f->admin_service->RevokeCurator(curator); });
}

void TestStatsReflectsLedgerState() {
  auto f = MakeFixture();

  auto stats = f->admin_service->Stats({});
  assert(stats.active_loans() == 0);
  assert(stats.members() == 1);
  assert(stats.catalog_items() == 1);

  lending::v1::BorrowRequest borrow;
  borrow.set_borrower("alice");
  borrow.set_item_id(1);
  borrow.set_sent_value(10);
  f->lending_service->Borrow(borrow);
  // A rejected request leaves no trace in the ledger figures.
  ExpectError<lending::util::StateConflict>(ErrorReason::kActiveLoanExists, [&] { f->lending_service->Borrow(borrow); });

  lending::v1::MembershipRequest grant;
  grant.set_caller("steward");
  grant.set_account("carol");
  f->admin_service->GrantMembership(grant);

  f->clock->Advance(150);
  stats = f->admin_service->Stats({});
  assert(stats.active_loans() == 1);
  assert(stats.overdue_loans() == 1);
  assert(stats.returning_loans() == 0);
  assert(stats.escrowed_total() == 10);
  assert(stats.pool_balance() == 0);
  assert(stats.held_funds() == 10);
  assert(stats.catalog_items() == 1);
  assert(stats.members() == 2);

  lending::v1::ReturnItemRequest give_back;
  give_back.set_borrower("alice");
  give_back.set_item_id(1);
  assert(f->lending_service->ReturnItem(give_back).late());

  stats = f->admin_service->Stats({});
  assert(stats.active_loans() == 0);
  assert(stats.overdue_loans() == 0);
  assert(stats.escrowed_total() == 0);
  assert(stats.pool_balance() == 10);
  assert(stats.held_funds() == 10);
}

} // namespace

int main() {
  TestGetAndUpdatePolicy();
  TestMembershipAdministration();
  TestWithdrawForfeits();
  TestRenouncedStewardshipLocksAdministration();
  TestStatsReflectsLedgerState();

  std::cout << "lending_ledger_unit_admin_service: pass\n";
  return 0;
}
