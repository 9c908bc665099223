#include "linear_regression_model.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace {

constexpr double COLLINEAR_TOLERANCE = 1e-9;

// Solves a*x = b in place by Gaussian elimination with partial pivoting
std::vector<double> solve_linear_system(std::vector<std::vector<double>> a,
                                        std::vector<double> b) {
  const size_t n = b.size();
  for (size_t col = 0; col < n; ++col) {
    size_t pivot = col;
    for (size_t row = col + 1; row < n; ++row)
      if (std::abs(a[row][col]) > std::abs(a[pivot][col]))
        pivot = row;

    if (std::abs(a[pivot][col]) < 1e-12)
      throw TrainingError("normal equations are singular");

    std::swap(a[col], a[pivot]);
    std::swap(b[col], b[pivot]);

    for (size_t row = col + 1; row < n; ++row) {
      const double factor = a[row][col] / a[col][col];
      for (size_t k = col; k < n; ++k)
        a[row][k] -= factor * a[col][k];
      b[row] -= factor * b[col];
    }
  }

  std::vector<double> x(n, 0.0);
  for (size_t i = n; i-- > 0;) {
    double acc = b[i];
    for (size_t k = i + 1; k < n; ++k)
      acc -= a[i][k] * x[k];
    x[i] = acc / a[i][i];
  }
  return x;
}

} // namespace

LinearRegressionModel::LinearRegressionModel(double ridge_lambda)
    : ridge_lambda_(ridge_lambda) {}

void LinearRegressionModel::fit(
    const std::vector<std::vector<double>> &features,
    const std::vector<double> &targets) {
  if (features.empty())
    throw TrainingError("training set is empty");
  if (features.size() != targets.size())
    throw TrainingError("feature rows and targets differ in length");

  const size_t rows = features.size();
  const size_t width = features.front().size();
  for (size_t i = 0; i < rows; ++i) {
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

  means_.assign(width, 0.0);
  scales_.assign(width, 0.0);
  double target_mean = 0.0;
  for (size_t i = 0; i < rows; ++i) {
    for (size_t j = 0; j < width; ++j)
      means_[j] += features[i][j];
    target_mean += targets[i];
  }
  for (auto &m : means_)
    m /= static_cast<double>(rows);
  target_mean /= static_cast<double>(rows);

  for (size_t i = 0; i < rows; ++i)
    for (size_t j = 0; j < width; ++j) {
      const double d = features[i][j] - means_[j];
      scales_[j] += d * d;
    }

  std::vector<size_t> active;
  for (size_t j = 0; j < width; ++j) {
    scales_[j] = std::sqrt(scales_[j] / static_cast<double>(rows));
    if (scales_[j] > 1e-12)
      active.push_back(j);
    else
      scales_[j] = 0.0;
  }

  weights_.assign(width, 0.0);
  intercept_ = target_mean;
  fitted_features_ = 0;

  if (!active.empty()) {
    const size_t n = active.size();
    std::vector<std::vector<double>> gram(n, std::vector<double>(n, 0.0));
    std::vector<double> xty(n, 0.0);
    std::vector<double> z(n);

    for (size_t i = 0; i < rows; ++i) {
      for (size_t a = 0; a < n; ++a) {
        const size_t j = active[a];
        z[a] = (features[i][j] - means_[j]) / scales_[j];
      }
      const double centered_target = targets[i] - target_mean;
      for (size_t a = 0; a < n; ++a) {
        xty[a] += z[a] * centered_target;
        for (size_t b = 0; b < n; ++b)
          gram[a][b] += z[a] * z[b];
      }
    }

    // Efficiency is a scaled copy of the power factor, so their standardized
    // columns coincide. Keep only the first of any perfectly correlated set.
    std::vector<size_t> kept;
    for (size_t b = 0; b < n; ++b) {
      bool duplicate = false;
      for (size_t a : kept)
        if (std::abs(gram[a][b]) / static_cast<double>(rows) >
            1.0 - COLLINEAR_TOLERANCE) {
          duplicate = true;
          break;
        }
      if (duplicate)
        scales_[active[b]] = 0.0;
      else
        kept.push_back(b);
    }

    const size_t k = kept.size();
    std::vector<std::vector<double>> xtx(k, std::vector<double>(k, 0.0));
    std::vector<double> rhs(k, 0.0);
    for (size_t a = 0; a < k; ++a) {
      rhs[a] = xty[kept[a]];
      for (size_t b = 0; b < k; ++b)
        xtx[a][b] = gram[kept[a]][kept[b]];
      xtx[a][a] += ridge_lambda_ * static_cast<double>(rows);
    }

    std::vector<double> solution = solve_linear_system(xtx, rhs);
    for (size_t a = 0; a < k; ++a) {
      if (!std::isfinite(solution[a]))
        throw TrainingError("ridge solution is not finite");
      weights_[active[kept[a]]] = solution[a];
    }
    fitted_features_ = k;
  }

  LOG(LogLevel::DEBUG, LogComponent::ML_TRAINING,
      "Linear model fit on " << rows << " rows with " << fitted_features_
                             << " active features, intercept "
                             << intercept_);
}

double
LinearRegressionModel::predict(const std::vector<double> &features) const {
  double prediction = intercept_;
  const size_t width = std::min(features.size(), weights_.size());
  for (size_t j = 0; j < width; ++j) {
    if (scales_[j] == 0.0)
      continue;
    prediction += weights_[j] * (features[j] - means_[j]) / scales_[j];
  }
  return prediction;
}
