#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "lending/v1/catalog_service.grpc.pb.h"
#include "internal/service/catalog_service.hpp"

namespace lending::grpc {

class CatalogServer final : public lending::v1::CatalogService::Service {
public:
  explicit CatalogServer(std::shared_ptr<lending::service::CatalogService> svc);

  ::grpc::Status CreateItem(::grpc::ServerContext*,
                            const lending::v1::CreateItemRequest*,
                            lending::v1::CreateItemResponse*) override;

  ::grpc::Status UpdateItem(::grpc::ServerContext*,
                            const lending::v1::UpdateItemRequest*,
                            lending::v1::UpdateItemResponse*) override;

  ::grpc::Status SetPaused(::grpc::ServerContext*,
                           const lending::v1::SetPausedRequest*,
                           lending::v1::SetPausedResponse*) override;

  ::grpc::Status MintUnits(::grpc::ServerContext*,
                           const lending::v1::MintUnitsRequest*,
                           lending::v1::MintUnitsResponse*) override;

  ::grpc::Status GetItem(::grpc::ServerContext*,
                         const lending::v1::GetItemRequest*,
                         lending::v1::GetItemResponse*) override;

  ::grpc::Status ListItems(::grpc::ServerContext*,
                           const lending::v1::ListItemsRequest*,
                           lending::v1::ListItemsResponse*) override;

private:
  std::shared_ptr<lending::service::CatalogService> service_;
};

}
