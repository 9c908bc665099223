#ifndef TELEMETRY_SAMPLE_HPP
#define TELEMETRY_SAMPLE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// One electrical reading as delivered by the transport
struct TelemetrySample {
  std::string device_id;
  uint64_t timestamp_ms = 0;
  double voltage = 0.0;
  double current = 0.0;
  double power = 0.0;
  std::optional<double> energy; // cumulative, informational only

  // Parses one JSON object. Throws MalformedSampleError when a required field
  // is missing, has the wrong type or is not finite. Samples without a
  // timestamp are stamped with `default_timestamp_ms`.
  static TelemetrySample parse_from_json(std::string_view json_text,
                                         uint64_t default_timestamp_ms);
};

// Engineered form of a sample, as stored in the history
struct FeatureRecord {
  double voltage = 0.0;
  double current = 0.0;
  double power = 0.0;
  double power_factor = 0.0;
  double efficiency = 0.0;
};

// power_factor = power / (voltage * current), efficiency = power_factor * 100.
// A zero apparent power makes the sample degenerate: both features are 0.
FeatureRecord make_feature_record(double voltage, double current,
                                  double power);
FeatureRecord make_feature_record(const TelemetrySample &sample);

#endif // TELEMETRY_SAMPLE_HPP
