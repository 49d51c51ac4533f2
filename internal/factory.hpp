#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/service/service_context.hpp"

namespace lending::util {
class Clock;
}

namespace lending::factory {

/*
  Application

  Owns the long-lived components of the server. The gRPC services are moved
  into runtime::Server; the context keeps the engine reachable for the
  lifetime of the process.
*/
struct Application {
  lending::service::ServiceContext             context;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Composition root. Constructs the in-memory collaborators, seeds members,
  catalog items and units from config, and wires the gRPC adapters.
  A null clock selects the system clock.
*/
Application Build(const lending::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<lending::util::Clock> clock = nullptr);

} // namespace lending::factory
