#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace fetchledger::runtime::config {
class RuntimeConfig;
}

namespace fetchledger::observability {

/*
  Process-wide metrics.

  Backed by OpenTelemetry when built with ENABLE_OTEL; every call is an
  inline no-op otherwise.
*/

bool InitializeMetrics(const fetchledger::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

class Metrics {
 public:
  static Metrics& Instance();

  // One State Manager transaction (operation = method name).
  void RecordOperation(std::string_view operation, bool success);
  void ObserveOperationLatencyMs(std::string_view operation, double latency_ms);

  // Time spent waiting in SqlitePool::Acquire.
  void ObservePoolWaitMs(double wait_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const fetchledger::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordOperation(std::string_view, bool) {
}

inline void Metrics::ObserveOperationLatencyMs(std::string_view, double) {
}

inline void Metrics::ObservePoolWaitMs(double) {
}
#endif

} // namespace fetchledger::observability
