#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "lending/v1/lending_service.grpc.pb.h"
#include "internal/service/lending_service.hpp"

namespace lending::grpc {

class LendingServer final : public lending::v1::LendingService::Service {
public:
  explicit LendingServer(std::shared_ptr<lending::service::LendingService> svc);

  ::grpc::Status Borrow(::grpc::ServerContext*,
                        const lending::v1::BorrowRequest*,
                        lending::v1::BorrowResponse*) override;

  ::grpc::Status ReturnItem(::grpc::ServerContext*,
                            const lending::v1::ReturnItemRequest*,
                            lending::v1::ReturnItemResponse*) override;

  ::grpc::Status RequestExtension(::grpc::ServerContext*,
                                  const lending::v1::RequestExtensionRequest*,
                                  lending::v1::RequestExtensionResponse*) override;

  ::grpc::Status GetLoan(::grpc::ServerContext*,
                         const lending::v1::GetLoanRequest*,
                         lending::v1::GetLoanResponse*) override;

  ::grpc::Status ListLoans(::grpc::ServerContext*,
                           const lending::v1::ListLoansRequest*,
                           lending::v1::ListLoansResponse*) override;

private:
  std::shared_ptr<lending::service::LendingService> service_;
};

}
