#ifndef REGRESSION_TREE_HPP
#define REGRESSION_TREE_HPP

#include <cstddef>
#include <memory>
#include <vector>

struct Node {
  int feature_index = -1;   // Which feature from the vector to check
  double split_value = 0.0; // Threshold value for split
  std::unique_ptr<Node> left_child;
  std::unique_ptr<Node> right_child;

  bool is_leaf = false;
  double prediction_value = 0.0;
};

struct TreeParams {
  size_t max_depth = 5;
  size_t min_samples_leaf = 2;
};

// Least-squares regression tree grown greedily: every split minimizes the
// summed squared error of its two children. Values below split_value go left.
class RegressionTree {
public:
  RegressionTree() = default;

  void fit(const std::vector<std::vector<double>> &features,
           const std::vector<double> &targets, const TreeParams &params);

  double predict(const std::vector<double> &features) const;

  size_t node_count() const;
  size_t depth() const;

private:
  std::unique_ptr<Node> root_;

  std::unique_ptr<Node> build_recursive(
      const std::vector<std::vector<double>> &features,
      const std::vector<double> &targets, std::vector<size_t> &indices,
      size_t depth, const TreeParams &params) const;

  double predict_recursive(const Node *node,
                           const std::vector<double> &features) const;
};

#endif // REGRESSION_TREE_HPP
