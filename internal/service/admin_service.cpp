#include "admin_service.hpp"

#include <optional>
#include <stdexcept>
#include <string>

#include "internal/catalog/catalog.hpp"
#include "internal/core/loan_ledger.hpp"
#include "internal/escrow/escrow_vault.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/funds/funds_sink.hpp"
#include "internal/membership/memory_membership_oracle.hpp"
#include "internal/policy/policy_store.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace lending::service {

using namespace lending::v1;
using lending::util::ErrorReason;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

LendingPolicy AdminService::CurrentPolicy() const {
  return ToProto(ctx_.policy->Policy(), ctx_.policy->Custodian(), ctx_.policy->Access());
}

AdminAck AdminService::Ack() const {
  AdminAck ack;
  *ack.mutable_policy() = CurrentPolicy();
  return ack;
}

GetPolicyResponse AdminService::GetPolicy(const GetPolicyRequest&) {
  return ObserveRpc("AdminService.GetPolicy", "", [&] {
    GetPolicyResponse resp;
    *resp.mutable_policy() = CurrentPolicy();
    return resp;
  });
}

UpdatePolicyResponse AdminService::UpdatePolicy(const UpdatePolicyRequest& req) {
  return ObserveRpc("AdminService.UpdatePolicy", req.caller(), [&] {
    ctx_.policy->Access().RequireSteward(req.caller(), "update policy");

    lending::model::PolicyUpdate update;
    try {
      if (req.has_loan_duration()) update.loan_duration = lending::util::FromProto(req.loan_duration());
      if (req.has_grace_period()) update.grace_period = lending::util::FromProto(req.grace_period());
      if (req.has_extension_duration()) update.extension_duration = lending::util::FromProto(req.extension_duration());
    } catch (const std::invalid_argument& e) {
      throw lending::util::InvalidValue(ErrorReason::kZeroDuration, std::string("update policy: ") + e.what());
    }
    if (req.has_deposit_amount()) update.deposit_amount = req.deposit_amount();
    if (req.has_max_extensions()) update.max_extensions = req.max_extensions();

    const auto applied = ctx_.policy->Update(req.caller(), update);

    UpdatePolicyResponse resp;
    *resp.mutable_policy() = ToProto(applied, ctx_.policy->Custodian(), ctx_.policy->Access());
    return resp;
  });
}

AdminAck AdminService::SetCustodian(const SetCustodianRequest& req) {
  return ObserveRpc("AdminService.SetCustodian", req.custodian(), [&] {
    ctx_.policy->SetCustodian(req.caller(), req.custodian());
    return Ack();
  });
}

AdminAck AdminService::TransferStewardship(const TransferStewardshipRequest& req) {
  return ObserveRpc("AdminService.TransferStewardship", req.new_steward(), [&] {
    ctx_.policy->TransferStewardship(req.caller(), req.new_steward());
    return Ack();
  });
}

AdminAck AdminService::RenounceStewardship(const RenounceStewardshipRequest& req) {
  return ObserveRpc("AdminService.RenounceStewardship", req.caller(), [&] {
    ctx_.policy->RenounceStewardship(req.caller());
    return Ack();
  });
}

AdminAck AdminService::GrantCurator(const CuratorRequest& req) {
  return ObserveRpc("AdminService.GrantCurator", req.account(), [&] {
    ctx_.policy->GrantCurator(req.caller(), req.account());
    return Ack();
  });
}

AdminAck AdminService::RevokeCurator(const CuratorRequest& req) {
  return ObserveRpc("AdminService.RevokeCurator", req.account(), [&] {
    ctx_.policy->RevokeCurator(req.caller(), req.account());
    return Ack();
  });
}

AdminAck AdminService::GrantMembership(const MembershipRequest& req) {
  return ObserveRpc("AdminService.GrantMembership", req.account(), [&] {
    ctx_.policy->Access().RequireSteward(req.caller(), "grant membership");
    if (req.account().empty()) {
      throw lending::util::InvalidValue(ErrorReason::kInvalidAccount, "grant membership: account must not be empty");
    }
    const std::optional<std::uint32_t> tier = req.tier() == 0 ? std::nullopt : std::optional<std::uint32_t>(req.tier());
    if (ctx_.membership->Grant(req.account(), tier) && ctx_.events) {
      ctx_.events->Publish(lending::model::MembershipChanged{req.account(), true, tier});
    }
    return Ack();
  });
}

AdminAck AdminService::RevokeMembership(const MembershipRequest& req) {
  return ObserveRpc("AdminService.RevokeMembership", req.account(), [&] {
    ctx_.policy->Access().RequireSteward(req.caller(), "revoke membership");
    if (ctx_.membership->Revoke(req.account()) && ctx_.events) {
      ctx_.events->Publish(lending::model::MembershipChanged{req.account(), false, std::nullopt});
    }
    return Ack();
  });
}

WithdrawForfeitsResponse AdminService::WithdrawForfeits(const WithdrawForfeitsRequest& req) {
  return ObserveRpc("AdminService.WithdrawForfeits", req.to(), [&] {
    ctx_.escrow->WithdrawPool(ctx_.policy->Access(), req.caller(), req.to(), req.amount());
    WithdrawForfeitsResponse resp;
    resp.set_pool_balance(ctx_.escrow->PoolBalance());
    return resp;
  });
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", "", [&] {
    StatsResponse resp;
    resp.set_active_loans(ctx_.ledger->ActiveLoanCount());
    resp.set_overdue_loans(ctx_.ledger->OverdueCount(ctx_.clock->Now()));
    resp.set_escrowed_total(ctx_.escrow->TotalEscrowed());
    resp.set_pool_balance(ctx_.escrow->PoolBalance());
    resp.set_held_funds(ctx_.funds->Balance());
    resp.set_catalog_items(ctx_.catalog->Size());
    resp.set_members(ctx_.membership->Size());
    resp.set_returning_loans(ctx_.ledger->ReturningCount());
    return resp;
  });
}

} // namespace lending::service
