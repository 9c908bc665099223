#include "analysis/predictive_detector.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/metrics_registry.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

TelemetrySample make_sample(double voltage, double current, double power) {
  TelemetrySample s;
  s.device_id = "meter-7";
  s.voltage = voltage;
  s.current = current;
  s.power = power;
  return s;
}

std::vector<FeatureRecord> make_power_records(size_t rows) {
  std::vector<FeatureRecord> records;
  for (size_t i = 0; i < rows; ++i) {
    const double current = static_cast<double>(i % 10 + 1);
    records.push_back(make_feature_record(230.0, current, 230.0 * current));
  }
  return records;
}

class ThrowingPredictRegressor : public IPowerRegressor {
public:
  void fit(const std::vector<std::vector<double>> &,
           const std::vector<double> &) override {}
  double predict(const std::vector<double> &) const override {
    throw std::runtime_error("numerical fault");
  }
  std::string get_name() const override { return "throwing"; }
};

} // namespace

class PredictiveDetectorTest : public ::testing::Test {
protected:
  void SetUp() override {
    predictor_ = std::make_unique<PowerPredictor>(config_);
    predictor_->fit(make_power_records(60), 1);
  }

  Config::PredictiveConfig config_;
  std::unique_ptr<PowerPredictor> predictor_;
};

TEST_F(PredictiveDetectorTest, LargeDeviationIsHighSeverity) {
  PredictiveDetector detector(config_);
  auto finding = detector.detect(make_sample(230.0, 5.0, 3000.0), 61,
                                 *predictor_);
  ASSERT_TRUE(finding.has_value());
  EXPECT_EQ(finding->kind, AnomalyKind::POWER_PREDICTION_ANOMALY);
  EXPECT_EQ(finding->method, DetectionMethod::PREDICTIVE);
  EXPECT_EQ(finding->severity, Severity::HIGH);
  EXPECT_GT(finding->score, 0.30);
  EXPECT_NE(finding->message.find("Power 3000.0W deviates"), std::string::npos);
  EXPECT_NE(finding->message.find("from ML prediction"), std::string::npos);
}

TEST_F(PredictiveDetectorTest, ModerateDeviationIsMediumSeverity) {
  PredictiveDetector detector(config_);
  // About 20% above the ~1150W prediction
  auto finding = detector.detect(make_sample(230.0, 5.0, 1380.0), 61,
                                 *predictor_);
  ASSERT_TRUE(finding.has_value());
  EXPECT_EQ(finding->severity, Severity::MEDIUM);
}

TEST_F(PredictiveDetectorTest, SmallDeviationIsNotAnAnomaly) {
  PredictiveDetector detector(config_);
  EXPECT_FALSE(
      detector.detect(make_sample(230.0, 5.0, 1200.0), 61, *predictor_));
}

TEST_F(PredictiveDetectorTest, SkipsBelowTrainingFloorOrWithoutModel) {
  PredictiveDetector detector(config_);
  EXPECT_FALSE(
      detector.detect(make_sample(230.0, 5.0, 3000.0), 49, *predictor_));

  PowerPredictor untrained(config_);
  EXPECT_FALSE(detector.detect(make_sample(230.0, 5.0, 3000.0), 61, untrained));
}

TEST_F(PredictiveDetectorTest, PredictionFaultIsSwallowed) {
  PowerPredictor faulty(config_, []() {
    return std::make_unique<ThrowingPredictRegressor>();
  });
  faulty.fit(make_power_records(60), 1);

  auto &faults = DetectorMetrics::instance().prediction_faults;
  const double before = faults.Value();

  PredictiveDetector detector(config_);
  std::optional<Finding> finding;
  EXPECT_NO_THROW(finding =
                      detector.detect(make_sample(230.0, 5.0, 3000.0), 61, faulty));
  EXPECT_FALSE(finding.has_value());
  EXPECT_DOUBLE_EQ(faults.Value(), before + 1);
}

TEST(RelativeErrorTest, DenominatorIsFlooredAtOne) {
  EXPECT_DOUBLE_EQ(PredictiveDetector::relative_error(1150.0, 1000.0, 1.0),
                   0.15);
  EXPECT_DOUBLE_EQ(PredictiveDetector::relative_error(2.0, 0.5, 1.0), 1.5);
  EXPECT_DOUBLE_EQ(PredictiveDetector::relative_error(2.0, -3.0, 1.0), 5.0);
}
