#ifndef FINDING_HPP
#define FINDING_HPP

#include <string>

enum class AnomalyKind {
  VOLTAGE_ANOMALY,
  CURRENT_ANOMALY,
  POWER_ANOMALY,
  POWER_OUTLIER,
  POWER_PREDICTION_ANOMALY
};

enum class DetectionMethod { Z_SCORE, IQR, PREDICTIVE };

enum class Severity { LOW, MEDIUM, HIGH };

std::string anomaly_kind_to_string(AnomalyKind kind);
std::string detection_method_to_string(DetectionMethod method);
std::string severity_to_string(Severity severity);

// Thresholds that split an already-triggered finding into severity tiers
struct SeverityThresholds {
  double z_score_high = 3.5;
  // IQR findings are high when the fence distance exceeds this many IQRs
  double iqr_high_factor = 2.0;
  double relative_error_high = 0.30;
};

// Pure severity tiering. `scale` is the unit the score is measured against;
// only the IQR method uses it (the interquartile range of the baseline).
Severity classify_severity(DetectionMethod method, double score,
                           const SeverityThresholds &thresholds,
                           double scale = 1.0);

struct Finding {
  bool is_anomaly = true;
  double score = 0.0;
  AnomalyKind kind = AnomalyKind::POWER_ANOMALY;
  DetectionMethod method = DetectionMethod::Z_SCORE;
  std::string message;
  Severity severity = Severity::LOW;

  Finding(double score, AnomalyKind kind, DetectionMethod method,
          std::string message, Severity severity);
};

#endif // FINDING_HPP
