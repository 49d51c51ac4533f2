#include "factory.hpp"

#include <memory>
#include <optional>
#include <set>
#include <vector>

#include "internal/catalog/catalog.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/core/loan_ledger.hpp"
#include "internal/escrow/escrow_vault.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/funds/memory_funds_sink.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/catalog_server.hpp"
#include "internal/grpc/lending_server.hpp"
#include "internal/inventory/memory_inventory_ledger.hpp"
#include "internal/membership/memory_membership_oracle.hpp"
#include "internal/observability/logging.hpp"
#include "internal/policy/policy_store.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/catalog_service.hpp"
#include "internal/service/lending_service.hpp"
#include "internal/util/time.hpp"

namespace lending::factory {

using namespace lending;

namespace {

model::ItemMetadata ToMetadata(const runtime::config::CatalogItemConfig& item) {
  model::ItemMetadata metadata;
  metadata.title       = item.title();
  metadata.author      = item.author();
  metadata.content_uri = item.content_uri();
  metadata.license     = item.license();
  if (!item.manifest_uri().empty()) metadata.manifest_uri = item.manifest_uri();
  if (!item.provenance_uri().empty()) metadata.provenance_uri = item.provenance_uri();
  metadata.contributors.assign(item.contributors().begin(), item.contributors().end());
  return metadata;
}

void SeedMembers(const runtime::config::RuntimeConfig& config, membership::MemoryMembershipOracle& oracle) {
  for (const auto& member : config.members()) {
    std::optional<std::uint32_t> tier;
    if (member.tier() != 0) tier = member.tier();
    oracle.Grant(member.account(), tier);
  }
}

void SeedCatalog(const runtime::config::RuntimeConfig& config, const service::ServiceContext& ctx) {
  const auto& steward = config.stewardship().steward();
  for (const auto& item : config.catalog()) {
    const auto access  = ctx.policy->Access();
    const auto item_id = ctx.catalog->CreateItem(access, steward, ToMetadata(item));

    if (item.units() > 0) {
      ctx.ledger->MintUnits(steward, item_id, item.units());
    }
    if (item.paused()) {
      ctx.catalog->SetPaused(access, steward, item_id, true);
    }

    LENDING_LOG_DEBUG("Seeded catalog item",
                      {observability::UintField("item_id", item_id), observability::StringField("title", item.title()),
                       observability::UintField("units", item.units())});
  }
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const runtime::config::RuntimeConfig& config, std::shared_ptr<util::Clock> clock) {
  config::ConfigLoader::Validate(config);

  Application app;

  // ------------------------------------------------------------------
  // Events
  // ------------------------------------------------------------------
  auto event_sink = std::make_shared<events::FanoutEventSink>(std::vector<std::shared_ptr<events::EventSink>>{
      std::make_shared<events::LoggingEventSink>(), std::make_shared<events::MetricsEventSink>()});

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  policy::PolicyStore::Roles roles;
  if (!config.stewardship().steward().empty()) roles.steward = config.stewardship().steward();
  roles.curators = std::set<model::AccountId>(config.stewardship().curators().begin(), config.stewardship().curators().end());

  auto policy_store = std::make_shared<policy::PolicyStore>(config::ConfigLoader::ToPolicy(config.policy()), config.custodian(),
                                                            std::move(roles), event_sink);
  auto item_catalog     = std::make_shared<catalog::Catalog>(event_sink);
  auto inventory_ledger = std::make_shared<inventory::MemoryInventoryLedger>();
  auto member_oracle    = std::make_shared<membership::MemoryMembershipOracle>();
  auto funds_sink       = std::make_shared<funds::MemoryFundsSink>(config.treasury().opening_balance());
  auto escrow_vault     = std::make_shared<escrow::EscrowVault>(funds_sink, event_sink);

  if (!clock) clock = std::make_shared<util::SystemClock>();

  // ------------------------------------------------------------------
  // Core
  // ------------------------------------------------------------------
  core::LedgerCollaborators deps;
  deps.policy     = policy_store;
  deps.catalog    = item_catalog;
  deps.inventory  = inventory_ledger;
  deps.membership = member_oracle;
  deps.escrow     = escrow_vault;
  deps.funds      = funds_sink;
  deps.events     = event_sink;
  deps.clock      = clock;

  auto ledger = std::make_shared<core::LoanLedger>(deps);

  service::ServiceContext ctx;
  ctx.ledger     = ledger;
  ctx.catalog    = item_catalog;
  ctx.policy     = policy_store;
  ctx.inventory  = inventory_ledger;
  ctx.membership = member_oracle;
  ctx.escrow     = escrow_vault;
  ctx.funds      = funds_sink;
  ctx.events     = event_sink;
  ctx.clock      = clock;

  SeedMembers(config, *member_oracle);
  SeedCatalog(config, ctx);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  auto lending_service = std::make_shared<service::LendingService>(ctx);
  auto catalog_service = std::make_shared<service::CatalogService>(ctx);
  auto admin_service   = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::LendingServer>(lending_service));
  app.grpc_services.push_back(std::make_unique<grpc::CatalogServer>(catalog_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  app.context = std::move(ctx);

  LENDING_LOG_INFO("Lending ledger built",
                   {observability::StringField("custodian", config.custodian()),
                    observability::UintField("members", member_oracle->Size()),
                    observability::UintField("catalog_items", item_catalog->Size())});

  return app;
}

} // namespace lending::factory
