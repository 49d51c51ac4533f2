#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace lending::service {

/*
  Wraps one RPC body: records success/failure and latency per route, and logs
  the failure before rethrowing it to the transport layer.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  auto&      metrics    = lending::observability::Metrics::Instance();
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      metrics.RecordRequest(route, true);
      metrics.ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      metrics.RecordRequest(route, true);
      metrics.ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    LENDING_LOG_WARN("RPC failed", {lending::observability::StringField("route", route), lending::observability::StringField("subject", subject),
                                    lending::observability::StringField("error", ex.what())});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace lending::service
