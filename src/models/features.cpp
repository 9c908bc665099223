#include "features.hpp"

#include <algorithm>

std::vector<double> build_feature_vector(const FeatureRecord &record) {
  std::vector<double> features(
      static_cast<size_t>(PowerFeature::FEATURE_COUNT), 0.0);
  features[static_cast<size_t>(PowerFeature::VOLTAGE)] = record.voltage;
  features[static_cast<size_t>(PowerFeature::CURRENT)] = record.current;
  features[static_cast<size_t>(PowerFeature::POWER_FACTOR)] =
      record.power_factor;
  features[static_cast<size_t>(PowerFeature::EFFICIENCY)] = record.efficiency;
  return features;
}

std::vector<double> build_query_feature_vector(double voltage, double current) {
  const double apparent_power = voltage * current;
  double power_factor = 0.0;
  if (current > 0.0)
    power_factor = apparent_power / std::max(apparent_power, 1.0);

  FeatureRecord query;
  query.voltage = voltage;
  query.current = current;
  query.power_factor = power_factor;
  query.efficiency = power_factor * 100.0;
  return build_feature_vector(query);
}
