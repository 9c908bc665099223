#include "telemetry_sample.hpp"
#include "errors.hpp"
#include "utils/utils.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <initializer_list>
#include <string>

namespace {

const nlohmann::json *find_first(const nlohmann::json &obj,
                                 std::initializer_list<const char *> keys) {
  for (const char *key : keys) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null())
      return &(*it);
  }
  return nullptr;
}

double read_finite(const nlohmann::json &obj,
                   std::initializer_list<const char *> keys,
                   const char *field_name) {
  const nlohmann::json *value = find_first(obj, keys);
  if (!value)
    throw MalformedSampleError(std::string("missing field '") + field_name +
                               "'");
  if (!value->is_number())
    throw MalformedSampleError(std::string("field '") + field_name +
                               "' is not a number");

  double number = value->get<double>();
  if (!std::isfinite(number))
    throw MalformedSampleError(std::string("field '") + field_name +
                               "' is not finite");
  return number;
}

} // namespace

TelemetrySample TelemetrySample::parse_from_json(std::string_view json_text,
                                                 uint64_t default_timestamp_ms) {
  nlohmann::json j = nlohmann::json::parse(json_text, nullptr, false);
  if (j.is_discarded())
    throw MalformedSampleError("payload is not valid JSON");
  if (!j.is_object())
    throw MalformedSampleError("payload is not a JSON object");

  TelemetrySample sample;

  const nlohmann::json *device =
      find_first(j, {"deviceId", "device_id", "deviceIdentifier",
                     "DeviceIdentifier"});
  if (!device || !device->is_string() ||
      device->get_ref<const std::string &>().empty())
    throw MalformedSampleError("missing or empty device identifier");
  sample.device_id = device->get<std::string>();

  sample.voltage = read_finite(j, {"voltage", "Voltage"}, "voltage");
  sample.current = read_finite(j, {"current", "Current"}, "current");
  sample.power = read_finite(j, {"power", "Power"}, "power");

  if (const nlohmann::json *energy = find_first(j, {"energy", "Energy"})) {
    if (!energy->is_number() || !std::isfinite(energy->get<double>()))
      throw MalformedSampleError("field 'energy' is not a finite number");
    sample.energy = energy->get<double>();
  }

  const nlohmann::json *ts = find_first(j, {"timestamp", "Timestamp"});
  if (!ts) {
    sample.timestamp_ms = default_timestamp_ms;
  } else if (ts->is_number_unsigned()) {
    sample.timestamp_ms = ts->get<uint64_t>();
  } else if (ts->is_number_integer()) {
    int64_t signed_ts = ts->get<int64_t>();
    if (signed_ts < 0)
      throw MalformedSampleError("timestamp is negative");
    sample.timestamp_ms = static_cast<uint64_t>(signed_ts);
  } else if (ts->is_string()) {
    auto parsed = Utils::convert_iso8601_to_ms(ts->get<std::string>());
    if (!parsed)
      throw MalformedSampleError("timestamp is not ISO-8601");
    sample.timestamp_ms = *parsed;
  } else {
    throw MalformedSampleError("timestamp has an unsupported type");
  }

  return sample;
}

FeatureRecord make_feature_record(double voltage, double current,
                                  double power) {
  FeatureRecord record;
  record.voltage = voltage;
  record.current = current;
  record.power = power;

  const double apparent_power = voltage * current;
  if (apparent_power != 0.0 && std::isfinite(apparent_power)) {
    record.power_factor = power / apparent_power;
    record.efficiency = record.power_factor * 100.0;
  }
  return record;
}

FeatureRecord make_feature_record(const TelemetrySample &sample) {
  return make_feature_record(sample.voltage, sample.current, sample.power);
}
