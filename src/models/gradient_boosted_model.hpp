#ifndef GRADIENT_BOOSTED_MODEL_HPP
#define GRADIENT_BOOSTED_MODEL_HPP

#include "base_model.hpp"
#include "regression_tree.hpp"

#include <cstddef>
#include <vector>

struct BoostingParams {
  size_t num_trees = 100;
  double learning_rate = 0.2;
  TreeParams tree;
};

// Least-squares gradient boosting: starts from the target mean and adds
// shrunken regression trees, each fit to the residuals of the ensemble so far.
class GradientBoostedModel : public IPowerRegressor {
public:
  explicit GradientBoostedModel(const BoostingParams &params = BoostingParams{});

  void fit(const std::vector<std::vector<double>> &features,
           const std::vector<double> &targets) override;
  double predict(const std::vector<double> &features) const override;
  std::string get_name() const override { return "gradient_boosting"; }

  size_t tree_count() const { return trees_.size(); }

private:
  BoostingParams params_;
  double base_prediction_ = 0.0;
  std::vector<RegressionTree> trees_;
};

#endif // GRADIENT_BOOSTED_MODEL_HPP
