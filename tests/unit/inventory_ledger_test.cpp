#include <cassert>
#include <iostream>

#include "internal/funds/memory_funds_sink.hpp"
#include "internal/inventory/memory_inventory_ledger.hpp"
#include "internal/membership/memory_membership_oracle.hpp"
#include "internal/util/errors.hpp"

namespace {

using lending::util::ErrorReason;

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

void TestMintAndTransfer() {
  lending::inventory::MemoryInventoryLedger ledger;
  ledger.Mint("branch", 1, 3);
  ledger.Mint("branch", 2, 1);

  assert(ledger.BalanceOf("branch", 1) == 3);
  assert(ledger.BalanceOf("alice", 1) == 0);
  assert(ledger.TotalSupply(1) == 3);

  ledger.Transfer("branch", "alice", 1, 2);
  assert(ledger.BalanceOf("branch", 1) == 1);
  assert(ledger.BalanceOf("alice", 1) == 2);
  assert(ledger.BalanceOf("alice", 2) == 0);
  assert(ledger.TotalSupply(1) == 3);

  ExpectError<lending::util::ResourceExhausted>(ErrorReason::kInsufficientUnits, [&] { ledger.Transfer("alice", "bob", 1, 3); });
  ExpectError<lending::util::ResourceExhausted>(ErrorReason::kInsufficientUnits, [&] { ledger.Transfer("bob", "alice", 2, 1); });
  ExpectError<lending::util::InvalidValue>(ErrorReason::kZeroAmount, [&] { ledger.Transfer("alice", "bob", 1, 0); });
  ExpectError<lending::util::InvalidValue>(ErrorReason::kZeroAmount, [&] { ledger.Mint("branch", 1, 0); });
  assert(ledger.BalanceOf("alice", 1) == 2);
}

void TestMembershipCards() {
  lending::membership::MemoryMembershipOracle oracle;
  assert(!oracle.IsMember("alice"));

  assert(oracle.Grant("alice"));
  assert(!oracle.Grant("alice"));
  assert(oracle.IsMember("alice"));
  assert(!oracle.Tier("alice").has_value());

  assert(oracle.Grant("alice", 3));
  assert(oracle.Tier("alice").value() == 3);
  assert(oracle.Size() == 1);

  assert(oracle.Revoke("alice"));
  assert(!oracle.Revoke("alice"));
  assert(!oracle.IsMember("alice"));
}

void TestFundsSink() {
  lending::funds::MemoryFundsSink funds(5);
  funds.Received(10);
  assert(funds.Balance() == 15);

  funds.PayOut("alice", 12);
  assert(funds.Balance() == 3);
  assert(funds.PaidTo("alice") == 12);

  ExpectError<lending::util::ResourceExhausted>(ErrorReason::kInsufficientFunds, [&] { funds.PayOut("bob", 4); });
  assert(funds.Balance() == 3);
  assert(funds.PaidTo("bob") == 0);
}

} // namespace

int main() {
  TestMintAndTransfer();
  TestMembershipCards();
  TestFundsSink();

  std::cout << "lending_ledger_unit_inventory_ledger: pass\n";
  return 0;
}
