#include "gradient_boosted_model.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace {

void validate_training_set(const std::vector<std::vector<double>> &features,
                           const std::vector<double> &targets) {
  if (features.empty())
    throw TrainingError("training set is empty");
  if (features.size() != targets.size())
    throw TrainingError("feature rows and targets differ in length");

  const size_t width = features.front().size();
  if (width == 0)
    throw TrainingError("feature rows are empty");

  for (size_t i = 0; i < features.size(); ++i) {
    if (features[i].size() != width)
      throw TrainingError("feature row " + std::to_string(i) +
                          " has inconsistent width");
    for (double x : features[i])
      if (!std::isfinite(x))
        throw TrainingError("feature row " + std::to_string(i) +
                            " contains a non-finite value");
    if (!std::isfinite(targets[i]))
      throw TrainingError("target " + std::to_string(i) + " is not finite");
  }
}

} // namespace

GradientBoostedModel::GradientBoostedModel(const BoostingParams &params)
    : params_(params) {}

void GradientBoostedModel::fit(const std::vector<std::vector<double>> &features,
                               const std::vector<double> &targets) {
  validate_training_set(features, targets);
  trees_.clear();

  double sum = 0.0;
  for (double y : targets)
    sum += y;
  base_prediction_ = sum / static_cast<double>(targets.size());

  std::vector<double> ensemble(targets.size(), base_prediction_);
  std::vector<double> residuals(targets.size());
  trees_.reserve(params_.num_trees);

  for (size_t t = 0; t < params_.num_trees; ++t) {
    double max_abs_residual = 0.0;
    for (size_t i = 0; i < targets.size(); ++i) {
      residuals[i] = targets[i] - ensemble[i];
      max_abs_residual = std::max(max_abs_residual, std::abs(residuals[i]));
    }

    // Training set already reproduced exactly
    if (max_abs_residual < 1e-9)
      break;

    RegressionTree tree;
    tree.fit(features, residuals, params_.tree);
    for (size_t i = 0; i < targets.size(); ++i)
      ensemble[i] += params_.learning_rate * tree.predict(features[i]);
    trees_.push_back(std::move(tree));
  }

  for (double value : ensemble)
    if (!std::isfinite(value))
      throw TrainingError("boosting produced a non-finite fit");

  LOG(LogLevel::DEBUG, LogComponent::ML_TRAINING,
      "Gradient boosting fit " << trees_.size() << " trees on "
                               << targets.size()
                               << " rows, base prediction "
                               << base_prediction_);
}

double
GradientBoostedModel::predict(const std::vector<double> &features) const {
  double prediction = base_prediction_;
  for (const auto &tree : trees_)
    prediction += params_.learning_rate * tree.predict(features);
  return prediction;
}
