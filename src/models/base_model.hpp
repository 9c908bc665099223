#ifndef BASE_MODEL_HPP
#define BASE_MODEL_HPP

#include <string>
#include <vector>

// Abstract base class for the power regressors. A model is fit exactly once
// on a fresh instance and is read-only afterwards, so a published model can
// be shared between threads without locking.
class IPowerRegressor {
public:
  virtual ~IPowerRegressor() = default;

  // Throws TrainingError when the data cannot produce a usable model
  virtual void fit(const std::vector<std::vector<double>> &features,
                   const std::vector<double> &targets) = 0;

  virtual double predict(const std::vector<double> &features) const = 0;

  virtual std::string get_name() const = 0;
};

#endif // BASE_MODEL_HPP
