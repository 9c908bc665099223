#ifndef FEATURES_HPP
#define FEATURES_HPP

#include "core/telemetry_sample.hpp"

#include <vector>

// Model inputs, in vector order. Power itself is the regression target.
enum class PowerFeature {
  VOLTAGE,
  CURRENT,
  POWER_FACTOR,
  EFFICIENCY,

  // This must always be the last item. It automatically provides the total
  // count.
  FEATURE_COUNT
};

std::vector<double> build_feature_vector(const FeatureRecord &record);

// Features for a prediction query, where the power draw is the unknown.
// The query assumes the device draws its full apparent power, so the power
// factor is (V*I) / max(V*I, 1) for positive current and 0 otherwise.
std::vector<double> build_query_feature_vector(double voltage, double current);

#endif // FEATURES_HPP
