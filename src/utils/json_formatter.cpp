#include "json_formatter.hpp"
#include "utils/utils.hpp"

nlohmann::json JsonFormatter::finding_to_json_object(const Finding &finding) {
  nlohmann::json j;
  j["is_anomaly"] = finding.is_anomaly;
  j["anomaly_type"] = anomaly_kind_to_string(finding.kind);
  j["detection_method"] = detection_method_to_string(finding.method);
  j["anomaly_score"] = finding.score;
  j["severity"] = severity_to_string(finding.severity);
  j["description"] = finding.message;
  return j;
}

nlohmann::json
JsonFormatter::findings_to_json_array(const std::vector<Finding> &findings) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto &finding : findings)
    arr.push_back(finding_to_json_object(finding));
  return arr;
}

nlohmann::json JsonFormatter::alert_to_json_object(const Alert &alert_data) {
  nlohmann::json j = finding_to_json_object(alert_data.finding);
  j["device_id"] = alert_data.device_id;
  j["timestamp_ms"] = alert_data.event_timestamp_ms;
  j["timestamp"] = Utils::format_ms_as_iso8601(alert_data.event_timestamp_ms);

  nlohmann::json j_reading;
  j_reading["voltage"] = alert_data.voltage;
  j_reading["current"] = alert_data.current;
  j_reading["power"] = alert_data.power;
  j["reading"] = j_reading;
  return j;
}

nlohmann::json
JsonFormatter::status_to_json_object(const EngineStatus &status) {
  nlohmann::json j;
  j["data_points"] = status.history_size;
  j["model_trained"] = status.model_trained;
  if (status.last_trained_ms) {
    j["last_trained_ms"] = *status.last_trained_ms;
    j["last_trained"] = Utils::format_ms_as_iso8601(*status.last_trained_ms);
  } else {
    j["last_trained_ms"] = nullptr;
    j["last_trained"] = nullptr;
  }
  j["trainings_completed"] = status.trainings_completed;
  return j;
}
