#include "predictive_detector.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

PredictiveDetector::PredictiveDetector(const Config::PredictiveConfig &config) {
  reconfigure(config);
}

void PredictiveDetector::reconfigure(const Config::PredictiveConfig &config) {
  config_ = config;
  thresholds_.relative_error_high = config.relative_error_high_threshold;
}

double PredictiveDetector::relative_error(double observed, double predicted,
                                          double min_denominator) {
  return std::abs(observed - predicted) / std::max(predicted, min_denominator);
}

std::optional<Finding>
PredictiveDetector::detect(const TelemetrySample &sample, size_t baseline_size,
                           const PowerPredictor &predictor) const {
  if (!config_.enabled || !predictor.is_ready() ||
      baseline_size < config_.min_training_size)
    return std::nullopt;

  double predicted = 0.0;
  try {
    predicted = predictor.predict(sample.voltage, sample.current);
  } catch (const std::exception &e) {
    DetectorMetrics::instance().prediction_faults.Increment();
    LOG(LogLevel::WARN, LogComponent::DETECT_PREDICTIVE,
        "Prediction failed for device " << sample.device_id << ": "
                                        << e.what()
                                        << ". Skipping predictive check.");
    return std::nullopt;
  }

  const double rel_err = relative_error(sample.power, predicted,
                                        config_.min_prediction_denominator);
  LOG(LogLevel::TRACE, LogComponent::DETECT_PREDICTIVE,
      "Observed " << sample.power << "W predicted " << predicted
                  << "W relative error " << rel_err);

  if (rel_err <= config_.relative_error_threshold)
    return std::nullopt;

  std::ostringstream msg;
  msg << std::fixed << std::setprecision(1) << "Power " << sample.power
      << "W deviates " << rel_err * 100.0 << "% from ML prediction "
      << predicted << "W";

  Severity severity =
      classify_severity(DetectionMethod::PREDICTIVE, rel_err, thresholds_);
  LOG(LogLevel::DEBUG, LogComponent::DETECT_PREDICTIVE,
      "Predictive rule triggered: relative error "
          << rel_err << " > " << config_.relative_error_threshold
          << " severity " << severity_to_string(severity));
  return Finding(rel_err, AnomalyKind::POWER_PREDICTION_ANOMALY,
                 DetectionMethod::PREDICTIVE, msg.str(), severity);
}
