#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "lending/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace lending::grpc {

class AdminServer final : public lending::v1::LendingAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<lending::service::AdminService> svc);

  ::grpc::Status GetPolicy(::grpc::ServerContext*,
                           const lending::v1::GetPolicyRequest*,
                           lending::v1::GetPolicyResponse*) override;

  ::grpc::Status UpdatePolicy(::grpc::ServerContext*,
                              const lending::v1::UpdatePolicyRequest*,
                              lending::v1::UpdatePolicyResponse*) override;

  ::grpc::Status SetCustodian(::grpc::ServerContext*,
                              const lending::v1::SetCustodianRequest*,
                              lending::v1::AdminAck*) override;

  ::grpc::Status TransferStewardship(::grpc::ServerContext*,
                                     const lending::v1::TransferStewardshipRequest*,
                                     lending::v1::AdminAck*) override;

  ::grpc::Status RenounceStewardship(::grpc::ServerContext*,
                                     const lending::v1::RenounceStewardshipRequest*,
                                     lending::v1::AdminAck*) override;

  ::grpc::Status GrantCurator(::grpc::ServerContext*,
                              const lending::v1::CuratorRequest*,
                              lending::v1::AdminAck*) override;

  ::grpc::Status RevokeCurator(::grpc::ServerContext*,
                               const lending::v1::CuratorRequest*,
                               lending::v1::AdminAck*) override;

  ::grpc::Status GrantMembership(::grpc::ServerContext*,
                                 const lending::v1::MembershipRequest*,
                                 lending::v1::AdminAck*) override;

  ::grpc::Status RevokeMembership(::grpc::ServerContext*,
                                  const lending::v1::MembershipRequest*,
                                  lending::v1::AdminAck*) override;

  ::grpc::Status WithdrawForfeits(::grpc::ServerContext*,
                                  const lending::v1::WithdrawForfeitsRequest*,
                                  lending::v1::WithdrawForfeitsResponse*) override;

  ::grpc::Status Stats(::grpc::ServerContext*,
                       const lending::v1::StatsRequest*,
                       lending::v1::StatsResponse*) override;

private:
  std::shared_ptr<lending::service::AdminService> service_;
};

}
