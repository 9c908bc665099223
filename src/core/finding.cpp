#include "finding.hpp"

#include <string>
#include <utility>

std::string anomaly_kind_to_string(AnomalyKind kind) {
  switch (kind) {
  case AnomalyKind::VOLTAGE_ANOMALY:
    return "Voltage Anomaly";
  case AnomalyKind::CURRENT_ANOMALY:
    return "Current Anomaly";
  case AnomalyKind::POWER_ANOMALY:
    return "Power Anomaly";
  case AnomalyKind::POWER_OUTLIER:
    return "Power Outlier";
  case AnomalyKind::POWER_PREDICTION_ANOMALY:
    return "Power Prediction Anomaly";
  }
  return "Unknown";
}

std::string detection_method_to_string(DetectionMethod method) {
  switch (method) {
  case DetectionMethod::Z_SCORE:
    return "Z-Score";
  case DetectionMethod::IQR:
    return "IQR";
  case DetectionMethod::PREDICTIVE:
    return "Predictive";
  }
  return "Unknown";
}

std::string severity_to_string(Severity severity) {
  switch (severity) {
  case Severity::LOW:
    return "low";
  case Severity::MEDIUM:
    return "medium";
  case Severity::HIGH:
    return "high";
  }
  return "unknown";
}

Severity classify_severity(DetectionMethod method, double score,
                           const SeverityThresholds &thresholds,
                           double scale) {
  switch (method) {
  case DetectionMethod::Z_SCORE:
    return score > thresholds.z_score_high ? Severity::HIGH : Severity::MEDIUM;
  case DetectionMethod::IQR:
    return score > thresholds.iqr_high_factor * scale ? Severity::HIGH
                                                      : Severity::MEDIUM;
  case DetectionMethod::PREDICTIVE:
    return score > thresholds.relative_error_high ? Severity::HIGH
                                                  : Severity::MEDIUM;
  }
  return Severity::LOW;
}

Finding::Finding(double score, AnomalyKind kind, DetectionMethod method,
                 std::string message, Severity severity)
    : is_anomaly(true), score(score), kind(kind), method(method),
      message(std::move(message)), severity(severity) {}
