#include "admin_server.hpp"
#include "grpc_error.hpp"

namespace lending::grpc {

AdminServer::AdminServer(std::shared_ptr<lending::service::AdminService> svc)
    : service_(std::move(svc)) {}

::grpc::Status AdminServer::GetPolicy(::grpc::ServerContext*,
                                      const lending::v1::GetPolicyRequest* req,
                                      lending::v1::GetPolicyResponse* resp) {
  try {
    *resp = service_->GetPolicy(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::UpdatePolicy(::grpc::ServerContext*,
                                         const lending::v1::UpdatePolicyRequest* req,
                                         lending::v1::UpdatePolicyResponse* resp) {
  try {
    *resp = service_->UpdatePolicy(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::SetCustodian(::grpc::ServerContext*,
                                         const lending::v1::SetCustodianRequest* req,
                                         lending::v1::AdminAck* resp) {
  try {
    *resp = service_->SetCustodian(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::TransferStewardship(::grpc::ServerContext*,
                                                const lending::v1::TransferStewardshipRequest* req,
                                                lending::v1::AdminAck* resp) {
  try {
    *resp = service_->TransferStewardship(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::RenounceStewardship(::grpc::ServerContext*,
                                                const lending::v1::RenounceStewardshipRequest* req,
                                                lending::v1::AdminAck* resp) {
  try {
    *resp = service_->RenounceStewardship(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GrantCurator(::grpc::ServerContext*,
                                         const lending::v1::CuratorRequest* req,
                                         lending::v1::AdminAck* resp) {
  try {
    *resp = service_->GrantCurator(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::RevokeCurator(::grpc::ServerContext*,
                                          const lending::v1::CuratorRequest* req,
                                          lending::v1::AdminAck* resp) {
  try {
    *resp = service_->RevokeCurator(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GrantMembership(::grpc::ServerContext*,
                                            const lending::v1::MembershipRequest* req,
                                            lending::v1::AdminAck* resp) {
  try {
    *resp = service_->GrantMembership(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::RevokeMembership(::grpc::ServerContext*,
                                             const lending::v1::MembershipRequest* req,
                                             lending::v1::AdminAck* resp) {
  try {
    *resp = service_->RevokeMembership(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::WithdrawForfeits(::grpc::ServerContext*,
                                             const lending::v1::WithdrawForfeitsRequest* req,
                                             lending::v1::WithdrawForfeitsResponse* resp) {
  try {
    *resp = service_->WithdrawForfeits(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*,
                                  const lending::v1::StatsRequest* req,
                                  lending::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
