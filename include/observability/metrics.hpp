#ifndef METRICS_HPP_
#define METRICS_HPP_

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace txledger {
namespace observability {

/**
 * Metrics collection for replay runs.
 * Supports counters, gauges and histograms with Prometheus-compatible output.
 */
class MetricsCollector {
 public:
  MetricsCollector() = default;

  // Non-copyable
  MetricsCollector(const MetricsCollector&) = delete;
  MetricsCollector& operator=(const MetricsCollector&) = delete;

  // Counter: monotonically increasing value
  void incrementCounter(const std::string& name, double value = 1.0);
  double counterValue(const std::string& name) const;

  // Gauge: value that can go up and down
  void setGauge(const std::string& name, double value);
  double gaugeValue(const std::string& name) const;

  // Histogram: distribution of values
  void observeHistogram(const std::string& name, double value);

  // HELP line used on export; metrics without one get a generic text.
  void describe(const std::string& name, const std::string& help);

  // Records the lifetime of the timer, in seconds, into a histogram.
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

  // Export metrics in Prometheus format, sorted by name.
  std::string exportMetrics() const;

  void reset();

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

  std::string helpFor(const std::string& name, const char* kind) const;

  static std::vector<double> defaultBuckets();

  mutable std::mutex mutex_;
  std::map<std::string, double> counters_;
  std::map<std::string, double> gauges_;
  std::map<std::string, Histogram> histograms_;
  std::map<std::string, std::string> help_;
};

// Global metrics instance
MetricsCollector& getGlobalMetrics();

}  // namespace observability
}  // namespace txledger

#endif  // METRICS_HPP_
