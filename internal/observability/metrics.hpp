#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace lending::runtime::config {
class RuntimeConfig;
}

namespace lending::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"lending-ledger"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeMetrics(const lending::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  OTLP-exported counters for RPC traffic and ledger events. Without
  ENABLE_OTEL every call is a no-op.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void RecordLedgerEvent(std::string_view event);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const lending::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordLedgerEvent(std::string_view) {
}
#endif

} // namespace lending::observability
