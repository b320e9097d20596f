#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace authbridge {

/** A minimal metrics sink interface (counters + histograms + gauges). */
struct MetricsSink {
  virtual ~MetricsSink() = default;

  /** Monotonic counters (e.g., streams, denials, exchanges). */
  virtual void Counter(std::string_view name, uint64_t delta) = 0;

  /** Histograms (e.g., latency in milliseconds). */
  virtual void Histogram(std::string_view name, uint64_t value) = 0;

  /** Gauges for point-in-time values (e.g., active streams). */
  virtual void Gauge(std::string_view name, double value) { (void)name; (void)value; }
};

inline void EmitCounter(MetricsSink* metrics, std::string_view name, uint64_t delta = 1) {
  if (metrics) metrics->Counter(name, delta);
}

inline void EmitHistogram(MetricsSink* metrics, std::string_view name, uint64_t value) {
  if (metrics) metrics->Histogram(name, value);
}

inline void EmitGauge(MetricsSink* metrics, std::string_view name, double value) {
  if (metrics) metrics->Gauge(name, value);
}

/** Final status recorded on a span when it ends. */
enum class SpanStatus {
  kUnset,
  kOk,
  kError
};

/** Header name/value pairs carrying a span's trace context (W3C traceparent). */
using ContextHeaders = std::vector<std::pair<std::string, std::string>>;

/** A trace span interface (small surface area). */
struct TraceSpan {
  virtual ~TraceSpan() = default;

  virtual void SetAttribute(std::string_view key, int64_t value) = 0;
  virtual void SetAttribute(std::string_view key, std::string_view value) = 0;

  /** Must be called exactly once to finish the span. */
  virtual void End(SpanStatus status, std::string_view description) = 0;

  /** Headers that make downstream work a child of this span. */
  virtual ContextHeaders InjectContext() const = 0;

  /** Start a span nested under this one. The caller must end it. */
  virtual std::unique_ptr<TraceSpan> StartChild(std::string_view name) = 0;
};

/** A tracer creates root spans. If unset, tracing is disabled. */
struct Tracer {
  virtual ~Tracer() = default;
  virtual std::unique_ptr<TraceSpan> StartSpan(std::string_view name) = 0;

  /** Push buffered spans to the backend (best-effort). */
  virtual void Flush() {}

  /** Flush and stop exporting. */
  virtual void Shutdown() {}
};

}  // namespace authbridge
