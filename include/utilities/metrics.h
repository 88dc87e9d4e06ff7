#pragma once
#include <map>
#include <mutex>
#include <string>

/**
 * @brief Process-wide metrics registry exported in Prometheus text format.
 *
 * Series are keyed by metric name plus rendered label set, so
 * `chunkkeeper_gc_runs_total{strategy="refcount"}` and
 * `chunkkeeper_gc_runs_total{strategy="mark-sweep"}` are kept apart.
 */
class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  void setGauge(const std::string &name, double value,
                const std::map<std::string, std::string> &labels = {});

  void incrementCounter(const std::string &name, double value = 1.0,
                        const std::map<std::string, std::string> &labels = {});

  /** Record an observation (exported as _sum and _count). */
  void observe(const std::string &name, double value,
               const std::map<std::string, std::string> &labels = {});

  /** Current counter value, 0 when the series does not exist. */
  double counterValue(const std::string &name,
                      const std::map<std::string, std::string> &labels = {}) const;

  /** Current gauge value, 0 when the series does not exist. */
  double gaugeValue(const std::string &name,
                    const std::map<std::string, std::string> &labels = {}) const;

  std::string toPrometheus() const;

  /** Drop every series. Used by tests to start from a clean registry. */
  void reset();

  static std::string labelsToString(const std::map<std::string, std::string> &labels);

private:
  MetricsRegistry() = default;
  struct Histogram {
    double sum{0};
    unsigned long count{0};
  };

  mutable std::mutex mtx_;
  std::map<std::string, double> gauges_;
  std::map<std::string, double> counters_;
  std::map<std::string, Histogram> histograms_;
};
