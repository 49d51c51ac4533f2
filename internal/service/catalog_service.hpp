#pragma once

#include "lending/v1/catalog_service.pb.h"
#include "internal/model/types.hpp"
#include "service_context.hpp"

namespace lending::service {

class CatalogService {
public:
  explicit CatalogService(ServiceContext ctx);

  lending::v1::CreateItemResponse
  CreateItem(const lending::v1::CreateItemRequest& req);

  lending::v1::UpdateItemResponse
  UpdateItem(const lending::v1::UpdateItemRequest& req);

  lending::v1::SetPausedResponse
  SetPaused(const lending::v1::SetPausedRequest& req);

  lending::v1::MintUnitsResponse
  MintUnits(const lending::v1::MintUnitsRequest& req);

  lending::v1::GetItemResponse
  GetItem(const lending::v1::GetItemRequest& req);

  lending::v1::ListItemsResponse
  ListItems(const lending::v1::ListItemsRequest& req);

private:
  lending::v1::CatalogItem Describe(lending::model::ItemId item_id) const;

  ServiceContext ctx_;
};

}
