#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include <map>
#include <memory>
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <string>
#include <vector>

class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  std::shared_ptr<prometheus::Registry> get_registry();

  prometheus::Counter &create_counter(const std::string &name,
                                      const std::string &help);

  prometheus::Gauge &create_gauge(const std::string &name,
                                  const std::string &help);

  prometheus::Histogram &
  create_histogram(const std::string &name, const std::string &help,
                   const std::vector<double> &bucket_boundaries);

  prometheus::Family<prometheus::Counter> &
  create_counter_family(const std::string &name, const std::string &help,
                        const std::map<std::string, std::string> &labels = {});

private:
  MetricsRegistry();
  ~MetricsRegistry() = default;

  std::shared_ptr<prometheus::Registry> registry_;
};

// Process-wide detector instruments, registered once on first use. All
// engines and services in the process report into the same series.
class DetectorMetrics {
public:
  static DetectorMetrics &instance();

  DetectorMetrics(const DetectorMetrics &) = delete;
  DetectorMetrics &operator=(const DetectorMetrics &) = delete;

  prometheus::Counter &finding_counter(const std::string &method,
                                       const std::string &severity);

  prometheus::Counter &samples_ingested;
  prometheus::Counter &samples_rejected;
  prometheus::Counter &ingest_faults;
  prometheus::Counter &trainings_succeeded;
  prometheus::Counter &trainings_failed;
  prometheus::Counter &prediction_faults;
  prometheus::Counter &alerts_dispatched;
  prometheus::Counter &alerts_throttled;

  prometheus::Gauge &history_size;
  prometheus::Gauge &model_ready;

  prometheus::Histogram &ingest_duration_seconds;
  prometheus::Histogram &training_duration_seconds;

private:
  explicit DetectorMetrics(MetricsRegistry &registry);

  prometheus::Family<prometheus::Counter> &findings_family_;
};

#endif // METRICS_REGISTRY_HPP
