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
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace taskengine::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

constexpr std::uint64_t kDefaultExportIntervalMs = 1000;

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

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}, {"service.version", "0.1.0"}};
  return resource::Resource::Create(attrs);
}

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpConfig& config) {
  auto endpoint = ResolveEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

bool InstallProvider(const OtlpConfig& config, std::uint64_t export_interval_ms) {
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(export_interval_ms);

  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(config), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), BuildResource(config));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> task_transitions;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      task_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> store_writes;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   in_flight_gauge;

  std::atomic<std::int64_t> in_flight{0};
};

bool InitializeMetrics(const taskengine::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto interval_ms =
      observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : kDefaultExportIntervalMs;
  return InstallProvider(ResolveOtlpConfig(config), interval_ms);
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
  impl_->meter  = provider->GetMeter("task-engine", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("taskengine.request.count", "Total number of service requests", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("taskengine.request.latency_ms", "End-to-end request latency in milliseconds", "ms");
  impl_->task_transitions   = impl_->meter->CreateUInt64Counter("taskengine.task.transitions", "Task status transitions written", "1");
  impl_->task_duration_ms   = impl_->meter->CreateDoubleHistogram("taskengine.task.duration_ms", "Claim-to-terminal task duration", "ms");
  impl_->store_writes       = impl_->meter->CreateUInt64Counter("taskengine.store.writes", "Durable task writes by reason", "1");
  impl_->in_flight_gauge    = impl_->meter->CreateInt64ObservableGauge("taskengine.task.in_flight", "Tasks currently owned by a worker", "1");
  impl_->in_flight_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->in_flight.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordTaskTransition(std::string_view status) {
  if (!impl_ || !impl_->task_transitions) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"status", std::string(status)}};
  AddWithAttributes(impl_->task_transitions, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveTaskDurationMs(std::string_view status, double duration_ms) {
  if (!impl_ || !impl_->task_duration_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"status", std::string(status)}};
  RecordWithAttributes(impl_->task_duration_ms, duration_ms, attributes);
}

void Metrics::RecordStoreWrite(std::string_view reason) {
  if (!impl_ || !impl_->store_writes) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"reason", std::string(reason)}};
  AddWithAttributes(impl_->store_writes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::SetInFlightTasks(std::uint64_t count) {
  if (!impl_) {
    return;
  }
  impl_->in_flight.store(static_cast<std::int64_t>(count));
}

} // namespace taskengine::observability

#endif
