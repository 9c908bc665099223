#ifndef PREDICTIVE_DETECTOR_HPP
#define PREDICTIVE_DETECTOR_HPP

#include "core/config.hpp"
#include "core/finding.hpp"
#include "core/telemetry_sample.hpp"
#include "models/power_predictor.hpp"

#include <cstddef>
#include <optional>

// Compares the observed power draw with the model's prediction for the same
// voltage and current. Relative error is |observed - predicted| divided by
// max(predicted, min_prediction_denominator).
class PredictiveDetector {
public:
  explicit PredictiveDetector(const Config::PredictiveConfig &config);

  // `baseline_size` counts the history plus this sample. Returns nothing
  // while no model is published, while the baseline is below
  // the training floor, or when the prediction itself fails.
  std::optional<Finding> detect(const TelemetrySample &sample,
                                size_t baseline_size,
                                const PowerPredictor &predictor) const;

  void reconfigure(const Config::PredictiveConfig &config);

  static double relative_error(double observed, double predicted,
                               double min_denominator);

private:
  Config::PredictiveConfig config_;
  SeverityThresholds thresholds_;
};

#endif // PREDICTIVE_DETECTOR_HPP
