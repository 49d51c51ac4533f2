#include "lending_service.hpp"

#include <string>

#include "internal/core/loan_ledger.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_convert.hpp"

namespace lending::service {

using namespace lending::v1;

namespace {

std::string Subject(const std::string& borrower, std::uint64_t item_id) {
  return borrower + "/" + std::to_string(item_id);
}

} // namespace

LendingService::LendingService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

BorrowResponse LendingService::Borrow(const BorrowRequest& req) {
  return ObserveRpc("LendingService.Borrow", Subject(req.borrower(), req.item_id()), [&] {
    BorrowResponse resp;
    resp.set_due_date(ctx_.ledger->Borrow(req.borrower(), req.item_id(), req.sent_value()));
    return resp;
  });
}

ReturnItemResponse LendingService::ReturnItem(const ReturnItemRequest& req) {
  return ObserveRpc("LendingService.ReturnItem", Subject(req.borrower(), req.item_id()), [&] {
    ReturnItemResponse resp;
    resp.set_late(ctx_.ledger->ReturnItem(req.borrower(), req.item_id()));
    return resp;
  });
}

RequestExtensionResponse LendingService::RequestExtension(const RequestExtensionRequest& req) {
  return ObserveRpc("LendingService.RequestExtension", Subject(req.borrower(), req.item_id()), [&] {
    const auto               result = ctx_.ledger->RequestExtension(req.borrower(), req.item_id());
    RequestExtensionResponse resp;
    resp.set_due_date(result.due_date);
    resp.set_extensions_used(result.extensions_used);
    return resp;
  });
}

GetLoanResponse LendingService::GetLoan(const GetLoanRequest& req) {
  return ObserveRpc("LendingService.GetLoan", Subject(req.borrower(), req.item_id()), [&] {
    GetLoanResponse resp;
    const auto      loan = ctx_.ledger->GetLoan(req.borrower(), req.item_id());
    if (loan.has_value()) {
      resp.set_active(true);
      resp.set_due_date(loan->due_date);
      resp.set_deposit(loan->deposit);
      *resp.mutable_loan() = ToProto({req.borrower(), req.item_id()}, *loan);
    }
    return resp;
  });
}

ListLoansResponse LendingService::ListLoans(const ListLoansRequest& req) {
  return ObserveRpc("LendingService.ListLoans", req.borrower(), [&] {
    ListLoansResponse resp;
    for (const auto& [key, loan] : ctx_.ledger->LoansOf(req.borrower())) {
      *resp.add_loans() = ToProto(key, loan);
    }
    return resp;
  });
}

} // namespace lending::service
