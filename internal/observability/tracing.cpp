#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <mutex>
#include <utility>

#include "config/config.pb.h"

namespace practicedb::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

constexpr const char* kInstrumentationName    = "practicedb";
constexpr const char* kInstrumentationVersion = "0.1.0";
constexpr const char* kDefaultTracesEndpoint  = "http://localhost:4318/v1/traces";

// Provider installed by InitializeTracing and the tracer spans start from.
struct TracingState {
  std::mutex                                          mutex;
  std::shared_ptr<sdktrace::TracerProvider>           provider;
  opentelemetry::nostd::shared_ptr<trace_api::Tracer> tracer;
};

TracingState& State() {
  static TracingState state;
  return state;
}

// Config wins over the standard OTLP environment variables.
std::string TracesEndpoint(const practicedb::runtime::config::TracingConfig& config) {
  if (!config.otlp_endpoint().empty()) return config.otlp_endpoint();
  for (const char* name : {"OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(name)) return value;
  }
  return kDefaultTracesEndpoint;
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  auto&            state = State();
  std::scoped_lock lock(state.mutex);
  if (!state.tracer) {
    // Falls back to whatever global provider the host process installed.
    state.tracer = trace_api::Provider::GetTracerProvider()->GetTracer(kInstrumentationName, kInstrumentationVersion);
  }
  return state.tracer;
}

} // namespace

bool InitializeTracing(const practicedb::runtime::config::RuntimeConfig& config) {
  if (!config.tracing().enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto& tracing      = config.tracing();
  const auto  service_name = tracing.service_name().empty() ? std::string(kInstrumentationName) : tracing.service_name();

  otlp::OtlpHttpExporterOptions options;
  options.url = TracesEndpoint(tracing);

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(otlp::OtlpHttpExporterFactory::Create(options),
                                                               sdktrace::BatchSpanProcessorOptions{});
  resource::ResourceAttributes attributes;
  attributes.SetAttribute("service.name", opentelemetry::nostd::string_view(service_name));
  attributes.SetAttribute("service.version", kInstrumentationVersion);
  std::shared_ptr<sdktrace::TracerProvider> provider =
      sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attributes));

  auto&            state = State();
  std::scoped_lock lock(state.mutex);
  state.provider = provider;
  state.tracer   = provider->GetTracer(kInstrumentationName, kInstrumentationVersion);
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(provider));
  return static_cast<bool>(state.tracer);
}

void ShutdownTracing() {
  auto&            state = State();
  std::scoped_lock lock(state.mutex);
  if (state.provider) {
    state.provider->ForceFlush();
    state.provider->Shutdown();
  }
  state.provider.reset();
  state.tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = CurrentTracer();
  if (!tracer) return;

  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(trace_api::Tracer::WithActiveSpan(impl_->span));
}

SpanScope::SpanScope(std::string_view name, std::string_view collection) : SpanScope(name) {
  SetAttribute("db.collection", collection);
}

SpanScope::~SpanScope() {
  if (impl_->span) impl_->span->End();
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_->span) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetCount(std::string_view key, std::size_t value) {
  if (impl_->span) impl_->span->SetAttribute(std::string(key), static_cast<uint64_t>(value));
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_->span) impl_->span->AddEvent(std::string(name));
}

void SpanScope::RecordError(const std::exception& error) {
  if (!impl_->span) return;
  impl_->span->AddEvent("exception", {{"exception.type", "std::exception"}, {"exception.message", std::string(error.what())}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, error.what());
}

} // namespace practicedb::observability

#endif
