#include "core/alert.hpp"
#include "utils/json_formatter.hpp"

#include <gtest/gtest.h>

TEST(JsonFormatterTest, FindingCarriesEveryField) {
  Finding finding(0.42, AnomalyKind::POWER_PREDICTION_ANOMALY,
                  DetectionMethod::PREDICTIVE,
                  "Power 1633.0W deviates 42.0% from ML prediction 1150.0W",
                  Severity::HIGH);
  auto j = JsonFormatter::finding_to_json_object(finding);

  EXPECT_TRUE(j["is_anomaly"].get<bool>());
  EXPECT_EQ(j["anomaly_type"], "Power Prediction Anomaly");
  EXPECT_EQ(j["detection_method"], "Predictive");
  EXPECT_DOUBLE_EQ(j["anomaly_score"].get<double>(), 0.42);
  EXPECT_EQ(j["severity"], "high");
  EXPECT_EQ(j["description"], finding.message);
}

TEST(JsonFormatterTest, EmptyFindingsBecomeEmptyArray) {
  auto arr = JsonFormatter::findings_to_json_array({});
  EXPECT_TRUE(arr.is_array());
  EXPECT_TRUE(arr.empty());
}

TEST(JsonFormatterTest, AlertIncludesDeviceAndReading) {
  Alert alert("meter-1", 1672574401250ULL,
              Finding(2.1, AnomalyKind::POWER_OUTLIER, DetectionMethod::IQR,
                      "outlier", Severity::MEDIUM));
  alert.voltage = 229.0;
  alert.current = 10.0;
  alert.power = 5000.0;

  auto j = JsonFormatter::alert_to_json_object(alert);
  EXPECT_EQ(j["device_id"], "meter-1");
  EXPECT_EQ(j["timestamp_ms"].get<uint64_t>(), 1672574401250ULL);
  EXPECT_EQ(j["timestamp"], "2023-01-01T12:00:01.250Z");
  EXPECT_EQ(j["detection_method"], "IQR");
  EXPECT_DOUBLE_EQ(j["reading"]["power"].get<double>(), 5000.0);
}

TEST(JsonFormatterTest, StatusBeforeAndAfterTraining) {
  EngineStatus untrained;
  untrained.history_size = 12;
  auto before = JsonFormatter::status_to_json_object(untrained);
  EXPECT_EQ(before["data_points"].get<size_t>(), 12u);
  EXPECT_FALSE(before["model_trained"].get<bool>());
  EXPECT_TRUE(before["last_trained_ms"].is_null());
  EXPECT_TRUE(before["last_trained"].is_null());

  EngineStatus trained;
  trained.history_size = 50;
  trained.model_trained = true;
  trained.last_trained_ms = 0;
  trained.trainings_completed = 1;
  auto after = JsonFormatter::status_to_json_object(trained);
  EXPECT_TRUE(after["model_trained"].get<bool>());
  EXPECT_EQ(after["last_trained"], "1970-01-01T00:00:00.000Z");
  EXPECT_EQ(after["trainings_completed"].get<uint64_t>(), 1u);
}
