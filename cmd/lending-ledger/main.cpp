#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/runtime/server.hpp"

namespace {

using lending::observability::IntField;
using lending::observability::StringField;
using lending::observability::UintField;

volatile std::sig_atomic_t g_running = 1;

constexpr const char* kDefaultBindAddress = "0.0.0.0:50061";

constexpr const char* kUsage = R"(Usage:
  lending-ledger <config.yaml>
  lending-ledger --config <config.yaml>
  lending-ledger --check-config <config.yaml>

--check-config validates the policy, stewardship and seed data and exits
without binding a port.
)";

void HandleSignal(int) {
  g_running = 0;
}

void ShutdownObservability() {
  lending::observability::ShutdownMetrics();
  lending::observability::ShutdownLogging();
}

void LogPolicy(const lending::runtime::config::RuntimeConfig& config) {
  const auto policy = lending::config::ConfigLoader::ToPolicy(config.policy());
  LENDING_LOG_INFO("Lending policy", {UintField("loan_duration_s", policy.loan_duration), UintField("deposit", policy.deposit_amount),
                                      UintField("grace_period_s", policy.grace_period),
                                      UintField("extension_duration_s", policy.extension_duration),
                                      UintField("max_extensions", policy.max_extensions)});
}

int CheckConfig(const std::string& path) {
  try {
    const auto config = lending::config::ConfigLoader::LoadFromYaml(path);
    lending::config::ConfigLoader::Validate(config);
    std::cout << path << ": ok (" << config.members_size() << " members, " << config.catalog_size() << " catalog items)" << std::endl;
    return 0;
  } catch (const std::exception& e) {
    std::cerr << path << ": " << e.what() << std::endl;
    return 2;
  }
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2 && std::string(argv[1]) != "--help") {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else if (argc == 3 && std::string(argv[1]) == "--check-config") {
    return CheckConfig(argv[2]);
  } else {
    std::cerr << kUsage;
    return 1;
  }

  try {
    auto config = lending::config::ConfigLoader::LoadFromYaml(config_path);

    lending::observability::InitializeLogging(config);
    if (lending::observability::InitializeMetrics(config)) {
      LENDING_LOG_INFO("OTLP metrics export enabled", {StringField("endpoint", config.observability().otlp_endpoint())});
    }

    // Build validates the config before anything is seeded.
    auto app = lending::factory::Build(config);
    LogPolicy(config);

    const std::string bind_address = config.server().bind_address().empty() ? kDefaultBindAddress : config.server().bind_address();
    lending::runtime::Server server(bind_address, std::move(app.grpc_services));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    LENDING_LOG_INFO("Lending ledger serving", {StringField("bind_address", bind_address), IntField("port", server.BoundPort())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(250));

    LENDING_LOG_INFO("Signal received, draining RPCs");
    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    LENDING_LOG_ERROR("Lending ledger failed", {StringField("config", config_path), StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
