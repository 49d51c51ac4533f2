#include "catalog_server.hpp"
#include "grpc_error.hpp"

namespace lending::grpc {

CatalogServer::CatalogServer(std::shared_ptr<lending::service::CatalogService> svc)
    : service_(std::move(svc)) {}

::grpc::Status CatalogServer::CreateItem(::grpc::ServerContext*,
                                         const lending::v1::CreateItemRequest* req,
                                         lending::v1::CreateItemResponse* resp) {
  try {
    *resp = service_->CreateItem(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::UpdateItem(::grpc::ServerContext*,
                                         const lending::v1::UpdateItemRequest* req,
                                         lending::v1::UpdateItemResponse* resp) {
  try {
    *resp = service_->UpdateItem(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::SetPaused(::grpc::ServerContext*,
                                        const lending::v1::SetPausedRequest* req,
                                        lending::v1::SetPausedResponse* resp) {
  try {
    *resp = service_->SetPaused(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::MintUnits(::grpc::ServerContext*,
                                        const lending::v1::MintUnitsRequest* req,
                                        lending::v1::MintUnitsResponse* resp) {
  try {
    *resp = service_->MintUnits(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::GetItem(::grpc::ServerContext*,
                                      const lending::v1::GetItemRequest* req,
                                      lending::v1::GetItemResponse* resp) {
  try {
    *resp = service_->GetItem(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::ListItems(::grpc::ServerContext*,
                                        const lending::v1::ListItemsRequest* req,
                                        lending::v1::ListItemsResponse* resp) {
  try {
    *resp = service_->ListItems(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
