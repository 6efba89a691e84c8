#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "config/config.pb.h"

namespace replication::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> pass_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> entry_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      pass_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   queued_work_gauge;

  std::mutex                                    queued_work_mutex;
  std::unordered_map<std::string, std::int64_t> queued_work_values;
};

bool InitializeMetrics(const replication::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == replication::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  auto endpoint = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto interval_ms = observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : 5000;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  auto res   = resource::Resource::Create({{"service.name", otlp_config.service_name}});
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
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
  impl_->meter  = provider->GetMeter("replication-manager", "0.1.0");

  impl_->pass_count       = impl_->meter->CreateUInt64Counter("replication.pass.count", "1", "Completed maintenance passes");
  impl_->entry_count      = impl_->meter->CreateUInt64Counter("replication.pass.entries", "1", "Entries handled by a pass, by outcome");
  impl_->pass_duration_ms = impl_->meter->CreateDoubleHistogram("replication.pass.duration_ms", "ms", "Wall time of one pass");
  impl_->queued_work_gauge =
      impl_->meter->CreateInt64ObservableGauge("replication.assigner.queued_work", "Work items believed outstanding on the work queue", "1");
  impl_->queued_work_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->queued_work_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [strategy, size] : impl->queued_work_values) {
          const std::initializer_list<AttributePair> attributes = {{"strategy", strategy}};
          int_result->Observe(size, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordPass(std::string_view component, bool success) {
  if (!impl_ || !impl_->pass_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"component", std::string(component)}, {"success", success}};
  impl_->pass_count->Add(1, attributes);
}

void Metrics::ObservePassDurationMs(std::string_view component, double duration_ms) {
  if (!impl_ || !impl_->pass_duration_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"component", std::string(component)}};
  impl_->pass_duration_ms->Record(duration_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordEntries(std::string_view component, std::string_view outcome, std::uint64_t count) {
  if (!impl_ || !impl_->entry_count || count == 0) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"component", std::string(component)}, {"outcome", std::string(outcome)}};
  impl_->entry_count->Add(count, attributes);
}

void Metrics::SetQueuedWork(std::string_view strategy, std::uint64_t size) {
  if (!impl_ || !impl_->queued_work_gauge) {
    return;
  }

  std::lock_guard<std::mutex> lock(impl_->queued_work_mutex);
  impl_->queued_work_values[std::string(strategy)] = static_cast<std::int64_t>(size);
}

} // namespace replication::observability

#endif
