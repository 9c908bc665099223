#include "statistical_detector.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>

namespace {

AnomalyKind kind_for_metric(Metric metric) {
  switch (metric) {
  case Metric::VOLTAGE:
    return AnomalyKind::VOLTAGE_ANOMALY;
  case Metric::CURRENT:
    return AnomalyKind::CURRENT_ANOMALY;
  default:
    return AnomalyKind::POWER_ANOMALY;
  }
}

const char *unit_for_metric(Metric metric) {
  switch (metric) {
  case Metric::VOLTAGE:
    return "V";
  case Metric::CURRENT:
    return "A";
  case Metric::POWER:
    return "W";
  default:
    return "";
  }
}

std::string capitalized(std::string s) {
  if (!s.empty())
    s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
  return s;
}

} // namespace

StatisticalDetector::StatisticalDetector(
    const Config::StatisticalConfig &config) {
  reconfigure(config);
}

void StatisticalDetector::reconfigure(
    const Config::StatisticalConfig &config) {
  config_ = config;
  thresholds_.z_score_high = config.z_score_high_threshold;
  thresholds_.iqr_high_factor = config.iqr_high_factor;
}

double StatisticalDetector::z_score(double value, const StatSummary &summary) {
  if (summary.stddev == 0.0)
    return 0.0;
  return std::abs(value - summary.mean) / summary.stddev;
}

std::vector<Finding>
StatisticalDetector::detect(const TelemetrySample &sample,
                            const HistoryStore &history) const {
  std::vector<Finding> findings;
  if (!config_.enabled)
    return findings;

  const size_t baseline_size = history.baseline_size();
  if (baseline_size < std::max<size_t>(config_.min_samples, 2)) {
    LOG(LogLevel::TRACE, LogComponent::DETECT_STATISTICAL,
        "Skipping statistical detection, baseline has "
            << baseline_size << " of " << config_.min_samples
            << " warm-up records.");
    return findings;
  }

  check_z_score(Metric::VOLTAGE, sample.voltage, history, findings);
  check_z_score(Metric::CURRENT, sample.current, history, findings);
  check_z_score(Metric::POWER, sample.power, history, findings);

  check_power_iqr(
      sample.power,
      compute_stat_summary(history.baseline_projection(Metric::POWER,
                                                       sample.power)),
      findings);

  return findings;
}

void StatisticalDetector::check_z_score(Metric metric, double value,
                                        const HistoryStore &history,
                                        std::vector<Finding> &findings) const {
  StatSummary stats =
      compute_stat_summary(history.baseline_projection(metric, value));
  double z = z_score(value, stats);

  LOG(LogLevel::TRACE, LogComponent::DETECT_STATISTICAL,
      metric_to_string(metric) << " value " << value << " mean " << stats.mean
                               << " stddev " << stats.stddev << " z " << z);

  if (z <= config_.z_score_threshold)
    return;

  const char *unit = unit_for_metric(metric);
  std::ostringstream msg;
  msg << std::fixed << std::setprecision(1) << capitalized(metric_to_string(metric))
      << " " << value << unit << " is " << z
      << " standard deviations from normal (" << stats.mean << "±"
      << stats.stddev << unit << ")";

  Severity severity =
      classify_severity(DetectionMethod::Z_SCORE, z, thresholds_);
  LOG(LogLevel::DEBUG, LogComponent::DETECT_STATISTICAL,
      "Z-score rule triggered for " << metric_to_string(metric) << ": z=" << z
                                    << " > " << config_.z_score_threshold
                                    << " severity "
                                    << severity_to_string(severity));
  findings.emplace_back(z, kind_for_metric(metric), DetectionMethod::Z_SCORE,
                        msg.str(), severity);
}

void StatisticalDetector::check_power_iqr(
    double power, const StatSummary &power_stats,
    std::vector<Finding> &findings) const {
  const double iqr = power_stats.iqr();
  const double lower_bound = power_stats.q1 - config_.iqr_multiplier * iqr;
  const double upper_bound = power_stats.q3 + config_.iqr_multiplier * iqr;

  if (power >= lower_bound && power <= upper_bound)
    return;

  const double distance = std::min(std::abs(power - lower_bound),
                                   std::abs(power - upper_bound));

  std::ostringstream msg;
  msg << std::fixed << std::setprecision(1) << "Power " << power
      << "W is an outlier (Normal range: " << lower_bound << "-" << upper_bound
      << "W)";

  Severity severity =
      classify_severity(DetectionMethod::IQR, distance, thresholds_, iqr);
  LOG(LogLevel::DEBUG, LogComponent::DETECT_STATISTICAL,
      "IQR fence triggered for power " << power << " outside [" << lower_bound
                                       << ", " << upper_bound
                                       << "] severity "
                                       << severity_to_string(severity));
  findings.emplace_back(distance, AnomalyKind::POWER_OUTLIER,
                        DetectionMethod::IQR, msg.str(), severity);
}
