#include "core/errors.hpp"
#include "models/features.hpp"
#include "models/gradient_boosted_model.hpp"
#include "models/linear_regression_model.hpp"
#include "models/regression_tree.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <vector>

namespace {

// power = V * I with V fixed at 230 and I cycling 1..10
void make_power_training_set(size_t rows,
                             std::vector<std::vector<double>> &features,
                             std::vector<double> &targets) {
  for (size_t i = 0; i < rows; ++i) {
    const double current = static_cast<double>(i % 10 + 1);
    FeatureRecord r = make_feature_record(230.0, current, 230.0 * current);
    features.push_back(build_feature_vector(r));
    targets.push_back(r.power);
  }
}

} // namespace

TEST(FeaturesTest, VectorLayoutMatchesFeatureEnum) {
  FeatureRecord r = make_feature_record(230.0, 2.0, 414.0);
  auto v = build_feature_vector(r);
  ASSERT_EQ(v.size(), static_cast<size_t>(PowerFeature::FEATURE_COUNT));
  EXPECT_DOUBLE_EQ(v[static_cast<size_t>(PowerFeature::VOLTAGE)], 230.0);
  EXPECT_DOUBLE_EQ(v[static_cast<size_t>(PowerFeature::CURRENT)], 2.0);
  EXPECT_NEAR(v[static_cast<size_t>(PowerFeature::POWER_FACTOR)], 0.9, 1e-12);
  EXPECT_NEAR(v[static_cast<size_t>(PowerFeature::EFFICIENCY)], 90.0, 1e-9);
}

TEST(FeaturesTest, QueryAssumesFullApparentPower) {
  auto q = build_query_feature_vector(230.0, 5.0);
  EXPECT_DOUBLE_EQ(q[static_cast<size_t>(PowerFeature::POWER_FACTOR)], 1.0);
  EXPECT_DOUBLE_EQ(q[static_cast<size_t>(PowerFeature::EFFICIENCY)], 100.0);

  auto idle = build_query_feature_vector(230.0, 0.0);
  EXPECT_DOUBLE_EQ(idle[static_cast<size_t>(PowerFeature::POWER_FACTOR)], 0.0);

  // Below 1 VA the denominator is floored at 1
  auto tiny = build_query_feature_vector(1.0, 0.5);
  EXPECT_DOUBLE_EQ(tiny[static_cast<size_t>(PowerFeature::POWER_FACTOR)], 0.5);
}

TEST(RegressionTreeTest, LearnsStepFunction) {
  std::vector<std::vector<double>> x;
  std::vector<double> y;
  for (int i = 0; i < 20; ++i) {
    x.push_back({static_cast<double>(i)});
    y.push_back(i < 10 ? 5.0 : 50.0);
  }

  RegressionTree tree;
  tree.fit(x, y, TreeParams{});
  EXPECT_DOUBLE_EQ(tree.predict({3.0}), 5.0);
  EXPECT_DOUBLE_EQ(tree.predict({15.0}), 50.0);
  EXPECT_EQ(tree.depth(), 1u);
  EXPECT_EQ(tree.node_count(), 3u);
}

TEST(RegressionTreeTest, ConstantTargetIsSingleLeaf) {
  RegressionTree tree;
  tree.fit({{1.0}, {2.0}, {3.0}, {4.0}}, {7.0, 7.0, 7.0, 7.0}, TreeParams{});
  EXPECT_EQ(tree.node_count(), 1u);
  EXPECT_DOUBLE_EQ(tree.predict({100.0}), 7.0);
}

TEST(GradientBoostedModelTest, RecoversPowerFromVoltageAndCurrent) {
  std::vector<std::vector<double>> x;
  std::vector<double> y;
  make_power_training_set(60, x, y);

  GradientBoostedModel model;
  model.fit(x, y);
  EXPECT_GT(model.tree_count(), 0u);
  EXPECT_NEAR(model.predict(build_query_feature_vector(230.0, 5.0)), 1150.0,
              15.0);
  EXPECT_NEAR(model.predict(build_query_feature_vector(230.0, 8.0)), 1840.0,
              15.0);
}

TEST(GradientBoostedModelTest, RejectsUnusableTrainingData) {
  GradientBoostedModel model;
  EXPECT_THROW(model.fit({}, {}), TrainingError);
  EXPECT_THROW(model.fit({{1.0}, {2.0}}, {1.0}), TrainingError);
  EXPECT_THROW(model.fit({{1.0}, {2.0, 3.0}}, {1.0, 2.0}), TrainingError);
  EXPECT_THROW(
      model.fit({{1.0}, {std::numeric_limits<double>::quiet_NaN()}}, {1, 2}),
      TrainingError);
}

TEST(LinearRegressionModelTest, FitsExactLinearRelation) {
  std::vector<std::vector<double>> x;
  std::vector<double> y;
  make_power_training_set(60, x, y);

  LinearRegressionModel model;
  model.fit(x, y);
  EXPECT_NEAR(model.predict(build_query_feature_vector(230.0, 5.0)), 1150.0,
              1.0);
  // Voltage, power factor and efficiency are constant and carry no weight
  EXPECT_DOUBLE_EQ(
      model.get_weights()[static_cast<size_t>(PowerFeature::VOLTAGE)], 0.0);
}

TEST(LinearRegressionModelTest, VaryingPowerFactorFitsWithoutRidge) {
  // Efficiency tracks the power factor exactly, so without pruning the
  // normal equations would be singular at lambda = 0
  std::vector<std::vector<double>> x;
  std::vector<double> y;
  double voltage_sum = 0.0, current_sum = 0.0, pf_sum = 0.0, power_sum = 0.0;
  for (size_t i = 0; i < 60; ++i) {
    const double voltage = 220.0 + static_cast<double>(i % 7);
    const double current = 1.0 + static_cast<double>(i % 10);
    const double pf = 0.8 + 0.02 * static_cast<double>(i % 9);
    FeatureRecord r =
        make_feature_record(voltage, current, voltage * current * pf);
    x.push_back(build_feature_vector(r));
    y.push_back(r.power);
    voltage_sum += voltage;
    current_sum += current;
    pf_sum += r.power_factor;
    power_sum += r.power;
  }

  LinearRegressionModel model(0.0);
  ASSERT_NO_THROW(model.fit(x, y));
  EXPECT_EQ(model.get_fitted_feature_count(), 3u);
  EXPECT_DOUBLE_EQ(
      model.get_weights()[static_cast<size_t>(PowerFeature::EFFICIENCY)], 0.0);

  // Least squares with an intercept passes through the centroid
  FeatureRecord centroid;
  centroid.voltage = voltage_sum / 60.0;
  centroid.current = current_sum / 60.0;
  centroid.power_factor = pf_sum / 60.0;
  centroid.efficiency = centroid.power_factor * 100.0;
  EXPECT_NEAR(model.predict(build_feature_vector(centroid)), power_sum / 60.0,
              1e-6);
}

TEST(LinearRegressionModelTest, RejectsNonFiniteTargets) {
  LinearRegressionModel model;
  EXPECT_THROW(model.fit({{1.0}, {2.0}},
                         {1.0, std::numeric_limits<double>::infinity()}),
               TrainingError);
}
