#pragma once

#include <memory>

namespace lending::core { class LoanLedger; }
namespace lending::catalog { class Catalog; }
namespace lending::policy { class PolicyStore; }
namespace lending::inventory { class MemoryInventoryLedger; }
namespace lending::membership { class MemoryMembershipOracle; }
namespace lending::escrow { class EscrowVault; }
namespace lending::funds { class FundsSink; }
namespace lending::events { class EventSink; }
namespace lending::util { class Clock; }

namespace lending::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<lending::core::LoanLedger>                   ledger;
  std::shared_ptr<lending::catalog::Catalog>                   catalog;
  std::shared_ptr<lending::policy::PolicyStore>                policy;
  std::shared_ptr<lending::inventory::MemoryInventoryLedger>   inventory;
  std::shared_ptr<lending::membership::MemoryMembershipOracle> membership;
  std::shared_ptr<lending::escrow::EscrowVault>                escrow;
  std::shared_ptr<lending::funds::FundsSink>                   funds;
  std::shared_ptr<lending::events::EventSink>                  events;
  std::shared_ptr<lending::util::Clock>                        clock;
};

}
