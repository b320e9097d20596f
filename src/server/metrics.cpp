#include <authbridge/server/metrics.hpp>

#include <drogon/drogon.h>

#include <iomanip>
#include <sstream>

namespace authbridge::server {

namespace {

// Histogram buckets for latency (in milliseconds)
const std::vector<double> kLatencyBuckets = {
    0.5, 1, 2.5, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000};

size_t FindBucket(double value, const std::vector<double>& buckets) {
  for (size_t i = 0; i < buckets.size(); ++i) {
    if (value <= buckets[i]) {
      return i;
    }
  }
  return buckets.size();  // +Inf bucket
}

std::string BaseName(const std::string& series) {
  size_t brace = series.find('{');
  return brace == std::string::npos ? series : series.substr(0, brace);
}

// Emit "# TYPE" once per base name, followed by all of its series.
template <typename Map, typename Fn>
void ExportFamily(std::ostringstream& out, const Map& series, const char* type, Fn&& emit) {
  std::map<std::string, std::vector<typename Map::const_iterator>> families;
  for (auto it = series.begin(); it != series.end(); ++it) {
    families[BaseName(it->first)].push_back(it);
  }
  for (const auto& [base, members] : families) {
    out << "# TYPE " << base << " " << type << "\n";
    for (const auto& it : members) {
      emit(it->first, it->second);
    }
  }
}

}  // namespace

// --- PrometheusMetrics ---

void PrometheusMetrics::Counter(std::string_view name, uint64_t delta) {
  std::lock_guard<std::mutex> lock(mu_);
  counters_[std::string(name)] += delta;
}

void PrometheusMetrics::Histogram(std::string_view name, uint64_t value) {
  std::lock_guard<std::mutex> lock(mu_);
  auto& h = histograms_[std::string(name)];
  if (h.buckets.empty()) {
    h.buckets.resize(kLatencyBuckets.size() + 1, 0);
  }
  size_t bucket = FindBucket(static_cast<double>(value), kLatencyBuckets);
  for (size_t i = bucket; i < h.buckets.size(); ++i) {
    h.buckets[i]++;
  }
  h.count++;
  h.sum += static_cast<double>(value);
}

void PrometheusMetrics::Gauge(std::string_view name, double value) {
  std::lock_guard<std::mutex> lock(mu_);
  gauges_[std::string(name)] = value;
}

void PrometheusMetrics::AddToGauge(const std::string& name, double delta) {
  std::lock_guard<std::mutex> lock(mu_);
  gauges_[name] += delta;
}

uint64_t PrometheusMetrics::CounterValue(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0 : it->second;
}

std::string PrometheusMetrics::Export() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream out;
  out << std::fixed << std::setprecision(6);

  ExportFamily(out, counters_, "counter", [&out](const std::string& name, uint64_t value) {
    out << name << " " << value << "\n";
  });

  ExportFamily(out, gauges_, "gauge", [&out](const std::string& name, double value) {
    out << name << " " << value << "\n";
  });

  // Histograms are exported without labels
  for (const auto& [name, data] : histograms_) {
    out << "# TYPE " << name << " histogram\n";
    for (size_t i = 0; i < kLatencyBuckets.size(); ++i) {
      out << name << "_bucket{le=\"" << kLatencyBuckets[i] << "\"} "
          << data.buckets[i] << "\n";
    }
    out << name << "_bucket{le=\"+Inf\"} " << data.buckets.back() << "\n";
    out << name << "_sum " << data.sum << "\n";
    out << name << "_count " << data.count << "\n";
  }

  return out.str();
}

// --- Metrics Handler Registration ---

void RegisterMetricsHandler(std::shared_ptr<PrometheusMetrics> metrics,
                            const std::string& path) {
  drogon::app().registerHandler(
      path,
      [metrics](const drogon::HttpRequestPtr& req,
                std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
        (void)req;
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setBody(metrics->Export());
        resp->setContentTypeString("text/plain; version=0.0.4; charset=utf-8");
        resp->setStatusCode(drogon::k200OK);
        callback(resp);
      },
      {drogon::Get});
}

}  // namespace authbridge::server
