#include "metrics_registry.hpp"

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry instance;
  return instance;
}

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()) {}

std::shared_ptr<prometheus::Registry> MetricsRegistry::get_registry() {
  return registry_;
}

prometheus::Counter &MetricsRegistry::create_counter(const std::string &name,
                                                     const std::string &help) {

  auto &counter_family =
      prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);

  return counter_family.Add({});
}

prometheus::Gauge &MetricsRegistry::create_gauge(const std::string &name,
                                                 const std::string &help) {

  auto &gauge_family =
      prometheus::BuildGauge().Name(name).Help(help).Register(*registry_);

  return gauge_family.Add({});
}

prometheus::Histogram &MetricsRegistry::create_histogram(
    const std::string &name, const std::string &help,
    const std::vector<double> &bucket_boundaries) {

  auto &histogram_family =
      prometheus::BuildHistogram().Name(name).Help(help).Register(*registry_);

  return histogram_family.Add({}, bucket_boundaries);
}

prometheus::Family<prometheus::Counter> &MetricsRegistry::create_counter_family(
    const std::string &name, const std::string &help,
    const std::map<std::string, std::string> &labels) {

  return prometheus::BuildCounter()
      .Name(name)
      .Help(help)
      .Labels(labels)
      .Register(*registry_);
}

DetectorMetrics &DetectorMetrics::instance() {
  static DetectorMetrics instance(MetricsRegistry::instance());
  return instance;
}

DetectorMetrics::DetectorMetrics(MetricsRegistry &registry)
    : samples_ingested(registry.create_counter(
          "power_samples_ingested_total",
          "Telemetry samples accepted by the anomaly engine")),
      samples_rejected(registry.create_counter(
          "power_samples_rejected_total",
          "Telemetry payloads rejected as malformed before ingestion")),
      ingest_faults(registry.create_counter(
          "power_ingest_faults_total",
          "Unexpected faults contained at the ingest boundary")),
      trainings_succeeded(registry.create_counter(
          "power_model_trainings_succeeded_total",
          "Predictive model fits that were published")),
      trainings_failed(registry.create_counter(
          "power_model_trainings_failed_total",
          "Predictive model fits that failed and were discarded")),
      prediction_faults(registry.create_counter(
          "power_prediction_faults_total",
          "Predictions that failed and were skipped")),
      alerts_dispatched(registry.create_counter(
          "power_alerts_dispatched_total", "Alerts handed to the dispatchers")),
      alerts_throttled(registry.create_counter(
          "power_alerts_throttled_total",
          "Alerts suppressed by the per-device cooldown")),
      history_size(registry.create_gauge(
          "power_history_size", "Feature records currently held in history")),
      model_ready(registry.create_gauge(
          "power_model_ready", "1 when a predictive model is published")),
      ingest_duration_seconds(registry.create_histogram(
          "power_ingest_duration_seconds", "Time spent in a single ingest call",
          {0.00001, 0.0001, 0.001, 0.01, 0.1, 1.0})),
      training_duration_seconds(registry.create_histogram(
          "power_model_training_duration_seconds",
          "Time spent fitting one predictive model",
          {0.001, 0.01, 0.1, 0.5, 1.0, 5.0, 30.0})),
      findings_family_(registry.create_counter_family(
          "power_findings_total", "Anomaly findings by method and severity")) {}

prometheus::Counter &DetectorMetrics::finding_counter(
    const std::string &method, const std::string &severity) {
  return findings_family_.Add({{"method", method}, {"severity", severity}});
}
