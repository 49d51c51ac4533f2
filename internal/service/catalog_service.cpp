#include "catalog_service.hpp"

#include <string>

#include "internal/catalog/catalog.hpp"
#include "internal/core/loan_ledger.hpp"
#include "internal/inventory/memory_inventory_ledger.hpp"
#include "internal/policy/policy_store.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/util/errors.hpp"

namespace lending::service {

using namespace lending::v1;

CatalogService::CatalogService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

lending::v1::CatalogItem CatalogService::Describe(lending::model::ItemId item_id) const {
  const auto item = ctx_.catalog->Get(item_id);
  if (!item.has_value()) {
    throw lending::util::NotFound(lending::util::ErrorReason::kNoSuchItem, "get item: item " + std::to_string(item_id) + " does not exist");
  }
  const auto custodian = ctx_.policy->Custodian();
  const auto available = custodian.empty() ? 0 : ctx_.inventory->BalanceOf(custodian, item_id);
  return ToProto(*item, available);
}

CreateItemResponse CatalogService::CreateItem(const CreateItemRequest& req) {
  return ObserveRpc("CatalogService.CreateItem", req.caller(), [&] {
    CreateItemResponse resp;
    resp.set_item_id(ctx_.catalog->CreateItem(ctx_.policy->Access(), req.caller(), FromProto(req.metadata())));
    return resp;
  });
}

UpdateItemResponse CatalogService::UpdateItem(const UpdateItemRequest& req) {
  return ObserveRpc("CatalogService.UpdateItem", std::to_string(req.item_id()), [&] {
    ctx_.catalog->UpdateMetadata(ctx_.policy->Access(), req.caller(), req.item_id(), FromProto(req.metadata()));
    UpdateItemResponse resp;
    *resp.mutable_item() = Describe(req.item_id());
    return resp;
  });
}

SetPausedResponse CatalogService::SetPaused(const SetPausedRequest& req) {
  return ObserveRpc("CatalogService.SetPaused", std::to_string(req.item_id()), [&] {
    ctx_.catalog->SetPaused(ctx_.policy->Access(), req.caller(), req.item_id(), req.paused());
    SetPausedResponse resp;
    *resp.mutable_item() = Describe(req.item_id());
    return resp;
  });
}

MintUnitsResponse CatalogService::MintUnits(const MintUnitsRequest& req) {
  return ObserveRpc("CatalogService.MintUnits", std::to_string(req.item_id()), [&] {
    ctx_.ledger->MintUnits(req.caller(), req.item_id(), req.quantity());
    MintUnitsResponse resp;
    resp.set_available(ctx_.inventory->BalanceOf(ctx_.policy->Custodian(), req.item_id()));
    return resp;
  });
}

GetItemResponse CatalogService::GetItem(const GetItemRequest& req) {
  return ObserveRpc("CatalogService.GetItem", std::to_string(req.item_id()), [&] {
    GetItemResponse resp;
    *resp.mutable_item() = Describe(req.item_id());
    return resp;
  });
}

ListItemsResponse CatalogService::ListItems(const ListItemsRequest&) {
  return ObserveRpc("CatalogService.ListItems", "", [&] {
    ListItemsResponse resp;
    const auto        custodian = ctx_.policy->Custodian();
    for (const auto& item : ctx_.catalog->List()) {
      const auto available = custodian.empty() ? 0 : ctx_.inventory->BalanceOf(custodian, item.id);
      *resp.add_items()    = ToProto(item, available);
    }
    return resp;
  });
}

} // namespace lending::service
