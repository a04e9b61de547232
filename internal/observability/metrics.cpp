#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace fetchledger::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const fetchledger::runtime::config::ObservabilityConfig& config) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }

  return "http://localhost:4318/v1/metrics";
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> operation_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      operation_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      pool_wait_ms;
};

bool InitializeMetrics(const fetchledger::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  otlp::OtlpHttpMetricExporterOptions exporter_options;
  exporter_options.url = ResolveEndpoint(observability);
  auto exporter        = otlp::OtlpHttpMetricExporterFactory::Create(exporter_options);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  const std::string service_name = observability.service_name().empty() ? "fetchledger" : observability.service_name();
  resource::ResourceAttributes attrs = {{"service.name", service_name}};

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("fetchledger", "0.1.0");

  impl_->operation_count      = impl_->meter->CreateUInt64Counter("fetchledger.state.operations", "1", "State manager transactions");
  impl_->operation_latency_ms = impl_->meter->CreateDoubleHistogram("fetchledger.state.operation_ms", "ms", "State manager transaction latency");
  impl_->pool_wait_ms         = impl_->meter->CreateDoubleHistogram("fetchledger.pool.wait_ms", "ms", "Connection pool acquisition wait");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordOperation(std::string_view operation, bool success) {
  if (!impl_ || !impl_->operation_count) {
    return;
  }

  const std::string                          name(operation);
  const std::initializer_list<AttributePair> attributes = {{"operation", name}, {"success", success}};
  impl_->operation_count->Add(static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveOperationLatencyMs(std::string_view operation, double latency_ms) {
  if (!impl_ || !impl_->operation_latency_ms) {
    return;
  }

  const std::string                          name(operation);
  const std::initializer_list<AttributePair> attributes = {{"operation", name}};
  impl_->operation_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::ObservePoolWaitMs(double wait_ms) {
  if (!impl_ || !impl_->pool_wait_ms) {
    return;
  }

  impl_->pool_wait_ms->Record(wait_ms, opentelemetry::context::Context{});
}

} // namespace fetchledger::observability

#endif
