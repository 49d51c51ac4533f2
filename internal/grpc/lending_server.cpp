#include "lending_server.hpp"
#include "grpc_error.hpp"

namespace lending::grpc {

LendingServer::LendingServer(std::shared_ptr<lending::service::LendingService> svc)
    : service_(std::move(svc)) {}

::grpc::Status LendingServer::Borrow(::grpc::ServerContext*,
                                     const lending::v1::BorrowRequest* req,
                                     lending::v1::BorrowResponse* resp) {
  try {
    *resp = service_->Borrow(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LendingServer::ReturnItem(::grpc::ServerContext*,
                                         const lending::v1::ReturnItemRequest* req,
                                         lending::v1::ReturnItemResponse* resp) {
  try {
    *resp = service_->ReturnItem(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LendingServer::RequestExtension(::grpc::ServerContext*,
                                               const lending::v1::RequestExtensionRequest* req,
                                               lending::v1::RequestExtensionResponse* resp) {
  try {
    *resp = service_->RequestExtension(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LendingServer::GetLoan(::grpc::ServerContext*,
                                      const lending::v1::GetLoanRequest* req,
                                      lending::v1::GetLoanResponse* resp) {
  try {
    *resp = service_->GetLoan(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LendingServer::ListLoans(::grpc::ServerContext*,
                                        const lending::v1::ListLoansRequest* req,
                                        lending::v1::ListLoansResponse* resp) {
  try {
    *resp = service_->ListLoans(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
