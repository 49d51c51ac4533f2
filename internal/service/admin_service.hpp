#pragma once

#include "lending/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace lending::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  lending::v1::GetPolicyResponse
  GetPolicy(const lending::v1::GetPolicyRequest& req);

  // Applies all set fields atomically; an invalid merged policy changes nothing.
  lending::v1::UpdatePolicyResponse
  UpdatePolicy(const lending::v1::UpdatePolicyRequest& req);

  lending::v1::AdminAck SetCustodian(const lending::v1::SetCustodianRequest& req);
  lending::v1::AdminAck TransferStewardship(const lending::v1::TransferStewardshipRequest& req);
  lending::v1::AdminAck RenounceStewardship(const lending::v1::RenounceStewardshipRequest& req);
  lending::v1::AdminAck GrantCurator(const lending::v1::CuratorRequest& req);
  lending::v1::AdminAck RevokeCurator(const lending::v1::CuratorRequest& req);
  lending::v1::AdminAck GrantMembership(const lending::v1::MembershipRequest& req);
  lending::v1::AdminAck RevokeMembership(const lending::v1::MembershipRequest& req);

  lending::v1::WithdrawForfeitsResponse
  WithdrawForfeits(const lending::v1::WithdrawForfeitsRequest& req);

  lending::v1::StatsResponse
  Stats(const lending::v1::StatsRequest& req);

private:
  lending::v1::LendingPolicy CurrentPolicy() const;
  lending::v1::AdminAck      Ack() const;

  ServiceContext ctx_;
};

}
