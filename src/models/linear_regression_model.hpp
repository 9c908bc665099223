#ifndef LINEAR_REGRESSION_MODEL_HPP
#define LINEAR_REGRESSION_MODEL_HPP

#include "base_model.hpp"

#include <cstddef>
#include <vector>

// Ridge regression on standardized features. Constant columns, and columns
// perfectly correlated with an earlier one, are dropped from the fit and
// contribute nothing at prediction time.
class LinearRegressionModel : public IPowerRegressor {
public:
  explicit LinearRegressionModel(double ridge_lambda = 1e-6);

  void fit(const std::vector<std::vector<double>> &features,
           const std::vector<double> &targets) override;
  double predict(const std::vector<double> &features) const override;
  std::string get_name() const override { return "linear"; }

  const std::vector<double> &get_weights() const { return weights_; }
  double get_intercept() const { return intercept_; }
  size_t get_fitted_feature_count() const { return fitted_features_; }

private:
  double ridge_lambda_;
  double intercept_ = 0.0;
  size_t fitted_features_ = 0;
  std::vector<double> means_;
  std::vector<double> scales_;  // 0 for columns left out of the fit
  std::vector<double> weights_; // In standardized space
};

#endif // LINEAR_REGRESSION_MODEL_HPP
