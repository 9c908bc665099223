#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "analysis/anomaly_engine.hpp"
#include "core/alert.hpp"
#include "core/finding.hpp"

#include <nlohmann/json.hpp>
#include <vector>

namespace JsonFormatter {

nlohmann::json finding_to_json_object(const Finding &finding);
nlohmann::json findings_to_json_array(const std::vector<Finding> &findings);

nlohmann::json alert_to_json_object(const Alert &alert_data);

// last_trained is null until the first successful fit
nlohmann::json status_to_json_object(const EngineStatus &status);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
