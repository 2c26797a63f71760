#include "observability/metrics.hpp"

#include <limits>
#include <sstream>

namespace payments {
namespace observability {

MetricsCollector::MetricsCollector() = default;

void MetricsCollector::incrementCounter(const std::string& name, double value) {
  std::lock_guard<std::mutex> lock(mutex_);
  counters_[name] += value;
}

void MetricsCollector::setGauge(const std::string& name, double value) {
  std::lock_guard<std::mutex> lock(mutex_);
  gauges_[name] = value;
}

void MetricsCollector::observeHistogram(const std::string& name, double value) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& hist = histograms_[name];

  // Initialize buckets on first observation
  if (hist.buckets.empty()) {
    for (double bound : defaultBuckets()) {
      hist.buckets.push_back({bound, 0});
    }
    hist.buckets.push_back({std::numeric_limits<double>::infinity(), 0});
  }

  hist.count += 1;
  hist.sum += value;

  // Buckets are stored non-cumulatively; export accumulates them.
  for (auto& bucket : hist.buckets) {
    if (value <= bucket.upper_bound) {
      bucket.count += 1;
      break;
    }
  }
}

void MetricsCollector::describe(const std::string& name, const std::string& help) {
  std::lock_guard<std::mutex> lock(mutex_);
  help_[name] = help;
}

double MetricsCollector::counterValue(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0.0 : it->second;
}

double MetricsCollector::gaugeValue(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = gauges_.find(name);
  return it == gauges_.end() ? 0.0 : it->second;
}

std::size_t MetricsCollector::histogramCount(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = histograms_.find(name);
  return it == histograms_.end() ? 0 : it->second.count;
}

MetricsCollector::Timer::Timer(MetricsCollector& collector, const std::string& name)
    : collector_(collector), name_(name), start_(std::chrono::steady_clock::now()) {
}

MetricsCollector::Timer::~Timer() {
  auto end = std::chrono::steady_clock::now();
  auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start_);
  double seconds = duration.count() / 1000000.0;
  collector_.observeHistogram(name_, seconds);
}

std::string MetricsCollector::helpFor(const std::string& name, const char* fallback) const {
  auto it = help_.find(name);
  return it == help_.end() ? std::string(fallback) : it->second;
}

std::string MetricsCollector::exportMetrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::stringstream ss;

  for (const auto& [name, value] : counters_) {
    ss << "# HELP " << name << " " << helpFor(name, "Counter metric") << "\n";
    ss << "# TYPE " << name << " counter\n";
    ss << name << " " << value << "\n";
  }

  for (const auto& [name, value] : gauges_) {
    ss << "# HELP " << name << " " << helpFor(name, "Gauge metric") << "\n";
    ss << "# TYPE " << name << " gauge\n";
    ss << name << " " << value << "\n";
  }

  for (const auto& [name, hist] : histograms_) {
    ss << "# HELP " << name << " " << helpFor(name, "Histogram metric") << "\n";
    ss << "# TYPE " << name << " histogram\n";

    std::size_t cumulative_count = 0;
    for (const auto& bucket : hist.buckets) {
      cumulative_count += bucket.count;

      if (bucket.upper_bound == std::numeric_limits<double>::infinity()) {
        ss << name << "_bucket{le=\"+Inf\"} " << cumulative_count << "\n";
      } else {
        ss << name << "_bucket{le=\"" << bucket.upper_bound << "\"} " << cumulative_count << "\n";
      }
    }

    ss << name << "_count " << hist.count << "\n";
    ss << name << "_sum " << hist.sum << "\n";
  }

  return ss.str();
}

std::vector<double> MetricsCollector::defaultBuckets() {
  return {0.000001, 0.000005, 0.00001, 0.00005, 0.0001, 0.0005, 0.001, 0.005, 0.01, 0.1, 1.0};
}

MetricsCollector& getGlobalMetrics() {
  static MetricsCollector instance;
  return instance;
}

}  // namespace observability
}  // namespace payments
