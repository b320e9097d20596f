#include <authbridge/otel_tracer.hpp>
#include <authbridge/internal.hpp>

#include <opentelemetry/context/context.h>
#include <opentelemetry/context/propagation/text_map_propagator.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/nostd/string_view.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/propagation/http_trace_context.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/span_startoptions.h>
#include <opentelemetry/trace/tracer.h>

#include <trantor/utils/Logger.h>

#include <exception>

namespace authbridge {

namespace {

namespace nostd = opentelemetry::nostd;
namespace trace_api = opentelemetry::trace;
namespace trace_sdk = opentelemetry::sdk::trace;
namespace resource = opentelemetry::sdk::resource;
namespace propagation = opentelemetry::context::propagation;

nostd::string_view ToNostd(std::string_view s) {
  return nostd::string_view(s.data(), s.size());
}

// Collects injected propagation headers into a vector.
class HeaderCarrier : public propagation::TextMapCarrier {
 public:
  nostd::string_view Get(nostd::string_view key) const noexcept override {
    (void)key;
    return "";
  }

  void Set(nostd::string_view key, nostd::string_view value) noexcept override {
    headers_.emplace_back(std::string(key.data(), key.size()),
                          std::string(value.data(), value.size()));
  }

  ContextHeaders Take() { return std::move(headers_); }

 private:
  ContextHeaders headers_;
};

trace_api::StatusCode ToOtelStatus(SpanStatus status) {
  switch (status) {
    case SpanStatus::kOk:
      return trace_api::StatusCode::kOk;
    case SpanStatus::kError:
      return trace_api::StatusCode::kError;
    case SpanStatus::kUnset:
    default:
      return trace_api::StatusCode::kUnset;
  }
}

class OtelSpan final : public TraceSpan {
 public:
  OtelSpan(nostd::shared_ptr<trace_api::Tracer> tracer,
           nostd::shared_ptr<trace_api::Span> span)
      : tracer_(std::move(tracer)), span_(std::move(span)) {}

  void SetAttribute(std::string_view key, int64_t value) override {
    span_->SetAttribute(ToNostd(key), value);
  }

  void SetAttribute(std::string_view key, std::string_view value) override {
    span_->SetAttribute(ToNostd(key), ToNostd(value));
  }

  void End(SpanStatus status, std::string_view description) override {
    span_->SetStatus(ToOtelStatus(status), ToNostd(description));
    span_->End();
  }

  ContextHeaders InjectContext() const override {
    opentelemetry::context::Context ctx;
    auto span_ctx = trace_api::SetSpan(ctx, span_);
    HeaderCarrier carrier;
    trace_api::propagation::HttpTraceContext().Inject(carrier, span_ctx);
    return carrier.Take();
  }

  std::unique_ptr<TraceSpan> StartChild(std::string_view name) override {
    trace_api::StartSpanOptions options;
    options.kind = trace_api::SpanKind::kInternal;
    options.parent = span_->GetContext();
    auto child = tracer_->StartSpan(ToNostd(name), options);
    return std::make_unique<OtelSpan>(tracer_, std::move(child));
  }

 private:
  nostd::shared_ptr<trace_api::Tracer> tracer_;
  nostd::shared_ptr<trace_api::Span> span_;
};

class OtelTracer final : public Tracer {
 public:
  OtelTracer(std::shared_ptr<trace_sdk::TracerProvider> provider,
             const std::string& scope)
      : provider_(std::move(provider)),
        tracer_(provider_->GetTracer(scope)) {}

  ~OtelTracer() override { Shutdown(); }

  std::unique_ptr<TraceSpan> StartSpan(std::string_view name) override {
    trace_api::StartSpanOptions options;
    options.kind = trace_api::SpanKind::kInternal;
    auto span = tracer_->StartSpan(ToNostd(name), options);
    return std::make_unique<OtelSpan>(tracer_, std::move(span));
  }

  void Flush() override { provider_->ForceFlush(); }

  void Shutdown() override {
    if (!shut_down_) {
      shut_down_ = true;
      provider_->Shutdown();
    }
  }

 private:
  std::shared_ptr<trace_sdk::TracerProvider> provider_;
  nostd::shared_ptr<trace_api::Tracer> tracer_;
  bool shut_down_ = false;
};

resource::Resource MakeResource(const OtelOptions& options) {
  resource::ResourceAttributes attributes;
  attributes.SetAttribute("service.name", ToNostd(options.service_name));
  attributes.SetAttribute("service.version", ToNostd(options.agent_version));
  attributes.SetAttribute("gen_ai.agent.name", ToNostd(options.agent_name));
  attributes.SetAttribute("gen_ai.agent.version", ToNostd(options.agent_version));
  attributes.SetAttribute("gen_ai.system", ToNostd(options.agent_provider));
  return resource::Resource::Create(attributes);
}

}  // namespace

std::string OtlpTracesUrl(const std::string& endpoint) {
  std::string url = internal::Trim(endpoint);
  if (!internal::StartsWith(url, "http://") && !internal::StartsWith(url, "https://")) {
    url = "http://" + url;
  }
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  if (!internal::EndsWith(url, "/v1/traces")) {
    url += "/v1/traces";
  }
  return url;
}

std::shared_ptr<Tracer> CreateOtelTracer(
    std::unique_ptr<trace_sdk::SpanProcessor> processor,
    const OtelOptions& options) {
  auto provider = std::make_shared<trace_sdk::TracerProvider>(
      std::move(processor), MakeResource(options));
  return std::make_shared<OtelTracer>(std::move(provider),
                                      options.instrumentation_scope);
}

std::shared_ptr<Tracer> CreateOtelTracer(const OtelOptions& options,
                                         std::string* error_out) {
  try {
    opentelemetry::exporter::otlp::OtlpHttpExporterOptions exporter_options;
    exporter_options.url = OtlpTracesUrl(options.endpoint);
    auto exporter =
        opentelemetry::exporter::otlp::OtlpHttpExporterFactory::Create(exporter_options);

    trace_sdk::BatchSpanProcessorOptions batch_options;
    auto processor = trace_sdk::BatchSpanProcessorFactory::Create(
        std::move(exporter), batch_options);

    LOG_INFO << "[OTEL] Exporting spans to " << exporter_options.url
             << " (service=" << options.service_name
             << ", agent=" << options.agent_name << ")";
    return CreateOtelTracer(std::move(processor), options);
  } catch (const std::exception& e) {
    if (error_out) {
      *error_out = std::string("failed to create OTLP exporter: ") + e.what();
    }
    return nullptr;
  }
}

}  // namespace authbridge
