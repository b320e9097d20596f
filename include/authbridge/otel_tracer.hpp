#pragma once

#include <authbridge/observability.hpp>

#include <opentelemetry/sdk/trace/processor.h>

#include <memory>
#include <string>

namespace authbridge {

/**
 * Settings for the OpenTelemetry tracer.
 *
 * The resource attributes are attached once to every exported span.
 */
struct OtelOptions {
  // OTLP/HTTP collector base URL. "/v1/traces" is appended unless present.
  std::string endpoint = "http://otel-collector.kagenti-system.svc.cluster.local:8335";
  std::string service_name = "weather-service";
  std::string agent_name = "weather-assistant";
  std::string agent_version = "1.0.0";
  std::string agent_provider = "langchain";
  std::string instrumentation_scope = "authbridge.otel.agent";
};

/**
 * Build the OTLP/HTTP traces URL from a collector base URL.
 * "collector:8335" and "http://collector:8335/" both map to
 * "http://collector:8335/v1/traces".
 */
std::string OtlpTracesUrl(const std::string& endpoint);

/**
 * Create a Tracer that exports over OTLP/HTTP through a batch processor.
 *
 * @param options Exporter and resource settings
 * @param error_out Error message output
 * @return Tracer instance or nullptr on failure
 */
std::shared_ptr<Tracer> CreateOtelTracer(const OtelOptions& options,
                                         std::string* error_out = nullptr);

/**
 * Create a Tracer on top of a caller-supplied span processor.
 * Used to plug in alternative exporters (in-memory, stdout).
 */
std::shared_ptr<Tracer> CreateOtelTracer(
    std::unique_ptr<opentelemetry::sdk::trace::SpanProcessor> processor,
    const OtelOptions& options);

}  // namespace authbridge
