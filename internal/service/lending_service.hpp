#pragma once

#include "lending/v1/lending_service.pb.h"
#include "service_context.hpp"

namespace lending::service {

class LendingService {
public:
  explicit LendingService(ServiceContext ctx);

  lending::v1::BorrowResponse
  Borrow(const lending::v1::BorrowRequest& req);

  lending::v1::ReturnItemResponse
  ReturnItem(const lending::v1::ReturnItemRequest& req);

  lending::v1::RequestExtensionResponse
  RequestExtension(const lending::v1::RequestExtensionRequest& req);

  lending::v1::GetLoanResponse
  GetLoan(const lending::v1::GetLoanRequest& req);

  lending::v1::ListLoansResponse
  ListLoans(const lending::v1::ListLoansRequest& req);

private:
  ServiceContext ctx_;
};

}
