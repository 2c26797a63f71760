#ifndef PAYMENTS_METRICS_HPP_
#define PAYMENTS_METRICS_HPP_

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace payments {
namespace observability {

/**
 * Simple metrics collection for a processing run.
 * Supports counters, gauges and histograms with Prometheus-compatible output.
 */
class MetricsCollector {
 public:
  MetricsCollector();
  ~MetricsCollector() = default;

  // Counter: monotonically increasing value
  void incrementCounter(const std::string& name, double value = 1.0);

  // Gauge: last value set
  void setGauge(const std::string& name, double value);

  // Histogram: distribution of values
  void observeHistogram(const std::string& name, double value);

  // Attach a HELP line to a metric of any type.
  void describe(const std::string& name, const std::string& help);

  double counterValue(const std::string& name) const;
  double gaugeValue(const std::string& name) const;
  std::size_t histogramCount(const std::string& name) const;

  // Records the lifetime of the timer into a histogram, in seconds.
  class Timer {
   public:
    Timer(MetricsCollector& collector, const std::string& name);
    ~Timer();

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

   private:
    MetricsCollector& collector_;
    std::string name_;
    std::chrono::steady_clock::time_point start_;
  };

  // Export metrics in Prometheus text format
  std::string exportMetrics() const;

 private:
  struct HistogramBucket {
    double upper_bound;
    std::size_t count{0};
  };

  struct Histogram {
    std::vector<HistogramBucket> buckets;
    std::size_t count{0};
    double sum{0.0};
  };

  std::string helpFor(const std::string& name, const char* fallback) const;

  mutable std::mutex mutex_;
  // Ordered maps keep the export stable between runs.
  std::map<std::string, double> counters_;
  std::map<std::string, double> gauges_;
  std::map<std::string, Histogram> histograms_;
  std::map<std::string, std::string> help_;

  // Default histogram buckets (in seconds)
  static std::vector<double> defaultBuckets();
};

// Global metrics instance
MetricsCollector& getGlobalMetrics();

}  // namespace observability
}  // namespace payments

#endif  // PAYMENTS_METRICS_HPP_
