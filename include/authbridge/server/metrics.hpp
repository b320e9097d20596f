#pragma once

#include <authbridge/observability.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace authbridge::server {

/**
 * Prometheus-compatible metrics sink.
 *
 * Collects counters, histograms, and gauges and exports them
 * in Prometheus text exposition format. A name may carry labels
 * (`name{key="value"}`); series sharing a base name are exported
 * under one TYPE line.
 */
class PrometheusMetrics : public MetricsSink {
 public:
  PrometheusMetrics() = default;

  // MetricsSink interface
  void Counter(std::string_view name, uint64_t delta) override;
  void Histogram(std::string_view name, uint64_t value) override;
  void Gauge(std::string_view name, double value) override;

  /**
   * Generate Prometheus text format output.
   */
  std::string Export() const;

  /** Current value of a counter series (0 if never incremented). */
  uint64_t CounterValue(const std::string& name) const;

  /** Add `delta` to a gauge (creating it at 0). */
  void AddToGauge(const std::string& name, double delta);

 private:
  mutable std::mutex mu_;

  // Ordered maps keep series of one base name adjacent in the export.
  std::map<std::string, uint64_t> counters_;

  // Histograms: name -> bucket values (using predefined buckets)
  struct HistogramData {
    std::vector<uint64_t> buckets;
    uint64_t count = 0;
    double sum = 0.0;
  };
  std::map<std::string, HistogramData> histograms_;

  std::map<std::string, double> gauges_;
};

/**
 * Register the metrics endpoint with the Drogon app.
 */
void RegisterMetricsHandler(std::shared_ptr<PrometheusMetrics> metrics,
                            const std::string& path);

}  // namespace authbridge::server
