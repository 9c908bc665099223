#include "analysis/history_store.hpp"
#include "analysis/statistical_detector.hpp"
#include "core/config.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

TelemetrySample make_sample(double voltage, double current, double power) {
  TelemetrySample s;
  s.device_id = "meter-1";
  s.timestamp_ms = 1700000000000ULL;
  s.voltage = voltage;
  s.current = current;
  s.power = power;
  return s;
}

const Finding *find_kind(const std::vector<Finding> &findings,
                         AnomalyKind kind) {
  auto it = std::find_if(findings.begin(), findings.end(),
                         [kind](const Finding &f) { return f.kind == kind; });
  return it == findings.end() ? nullptr : &*it;
}

} // namespace

class StatisticalDetectorTest : public ::testing::Test {
protected:
  Config::StatisticalConfig config_;
};

TEST_F(StatisticalDetectorTest, BelowWarmUpFloorReportsNothing) {
  StatisticalDetector detector(config_);
  HistoryStore history;
  for (int i = 0; i < 8; ++i)
    history.append(make_feature_record(230.0, 1.0, 100.0));

  // 8 recorded plus the candidate is still below the floor of 10
  EXPECT_TRUE(detector.detect(make_sample(500.0, 50.0, 99999.0), history)
                  .empty());
}

TEST_F(StatisticalDetectorTest, IdenticalHistoryAndSampleGiveZeroZ) {
  StatisticalDetector detector(config_);
  HistoryStore history;
  for (int i = 0; i < 12; ++i)
    history.append(make_feature_record(230.0, 1.0, 100.0));

  std::vector<double> values(13, 100.0);
  EXPECT_DOUBLE_EQ(StatisticalDetector::z_score(
                       100.0, compute_stat_summary(values)),
                   0.0);
  EXPECT_TRUE(detector.detect(make_sample(230.0, 1.0, 100.0), history).empty());
}

TEST_F(StatisticalDetectorTest, SpikeAgainstFlatHistoryIsHighZ) {
  StatisticalDetector detector(config_);
  HistoryStore history;
  for (int i = 0; i < 20; ++i)
    history.append(make_feature_record(230.0, 1.0, 100.0));

  auto findings = detector.detect(make_sample(230.0, 1.0, 1000.0), history);

  const Finding *power = find_kind(findings, AnomalyKind::POWER_ANOMALY);
  ASSERT_NE(power, nullptr);
  EXPECT_EQ(power->method, DetectionMethod::Z_SCORE);
  EXPECT_EQ(power->severity, Severity::HIGH);
  EXPECT_GT(power->score, 3.5);
  EXPECT_NE(power->message.find("Power 1000.0W is"), std::string::npos);
  EXPECT_NE(power->message.find("standard deviations from normal"),
            std::string::npos);

  // Voltage and current never moved
  EXPECT_EQ(find_kind(findings, AnomalyKind::VOLTAGE_ANOMALY), nullptr);
  EXPECT_EQ(find_kind(findings, AnomalyKind::CURRENT_ANOMALY), nullptr);
}

TEST_F(StatisticalDetectorTest, FullHistoryDropsOldestRecordFromBaseline) {
  StatisticalDetector detector(config_);
  HistoryStore history(10);
  history.append(make_feature_record(230.0, 1.0, 1000.0));
  for (int i = 0; i < 9; ++i)
    history.append(make_feature_record(230.0, 1.0, 100.0));
  ASSERT_EQ(history.size(), history.capacity());

  // Window is the nine 100W records plus the sample: mean 190, stddev 270.
  // Keeping the evicted 1000W record would pull z down to about 2.1.
  auto findings = detector.detect(make_sample(230.0, 1.0, 1000.0), history);

  const Finding *power = find_kind(findings, AnomalyKind::POWER_ANOMALY);
  ASSERT_NE(power, nullptr);
  EXPECT_NEAR(power->score, 3.0, 1e-9);
  EXPECT_EQ(power->severity, Severity::MEDIUM);
}

TEST_F(StatisticalDetectorTest, IqrFenceFiresOnlyOutsideTheSpread) {
  StatisticalDetector detector(config_);
  HistoryStore history;
  for (int i = 0; i <= 20; ++i)
    history.append(make_feature_record(230.0, 5.0, 1000.0 + 50.0 * i));

  auto outlier = detector.detect(make_sample(230.0, 5.0, 5000.0), history);
  const Finding *iqr = find_kind(outlier, AnomalyKind::POWER_OUTLIER);
  ASSERT_NE(iqr, nullptr);
  EXPECT_EQ(iqr->method, DetectionMethod::IQR);
  EXPECT_EQ(iqr->severity, Severity::HIGH);
  EXPECT_NE(iqr->message.find("is an outlier (Normal range:"),
            std::string::npos);

  auto normal = detector.detect(make_sample(230.0, 5.0, 1500.0), history);
  EXPECT_EQ(find_kind(normal, AnomalyKind::POWER_OUTLIER), nullptr);
  EXPECT_TRUE(normal.empty());
}

TEST_F(StatisticalDetectorTest, FindingsAreOrderedVoltageCurrentPower) {
  StatisticalDetector detector(config_);
  HistoryStore history;
  for (int i = 0; i < 30; ++i)
    history.append(make_feature_record(230.0 + (i % 3), 1.0 + 0.01 * (i % 3),
                                       230.0 + (i % 3)));

  auto findings = detector.detect(make_sample(400.0, 9.0, 5000.0), history);
  ASSERT_EQ(findings.size(), 4u);
  EXPECT_EQ(findings[0].kind, AnomalyKind::VOLTAGE_ANOMALY);
  EXPECT_EQ(findings[1].kind, AnomalyKind::CURRENT_ANOMALY);
  EXPECT_EQ(findings[2].kind, AnomalyKind::POWER_ANOMALY);
  EXPECT_EQ(findings[3].kind, AnomalyKind::POWER_OUTLIER);
}

TEST_F(StatisticalDetectorTest, DisabledDetectorIsSilent) {
  config_.enabled = false;
  StatisticalDetector detector(config_);
  HistoryStore history;
  for (int i = 0; i < 20; ++i)
    history.append(make_feature_record(230.0, 1.0, 100.0));
  EXPECT_TRUE(detector.detect(make_sample(230.0, 1.0, 1000.0), history).empty());
}

TEST(SeverityTest, TiersPerMethod) {
  SeverityThresholds t;
  EXPECT_EQ(classify_severity(DetectionMethod::Z_SCORE, 3.0, t),
            Severity::MEDIUM);
  EXPECT_EQ(classify_severity(DetectionMethod::Z_SCORE, 3.6, t),
            Severity::HIGH);
  EXPECT_EQ(classify_severity(DetectionMethod::IQR, 150.0, t, 100.0),
            Severity::MEDIUM);
  EXPECT_EQ(classify_severity(DetectionMethod::IQR, 250.0, t, 100.0),
            Severity::HIGH);
  EXPECT_EQ(classify_severity(DetectionMethod::PREDICTIVE, 0.2, t),
            Severity::MEDIUM);
  EXPECT_EQ(classify_severity(DetectionMethod::PREDICTIVE, 0.31, t),
            Severity::HIGH);
}
