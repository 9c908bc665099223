#include "regression_tree.hpp"

#include <algorithm>
#include <limits>
#include <memory>
#include <vector>

namespace {

struct SplitCandidate {
  int feature_index = -1;
  double split_value = 0.0;
  double sse = std::numeric_limits<double>::infinity();
};

double leaf_mean(const std::vector<double> &targets,
                 const std::vector<size_t> &indices) {
  double sum = 0.0;
  for (size_t idx : indices)
    sum += targets[idx];
  return sum / static_cast<double>(indices.size());
}

double sum_squared_error(const std::vector<double> &targets,
                         const std::vector<size_t> &indices) {
  const double mean = leaf_mean(targets, indices);
  double sse = 0.0;
  for (size_t idx : indices)
    sse += (targets[idx] - mean) * (targets[idx] - mean);
  return sse;
}

size_t count_nodes(const Node *node) {
  if (!node)
    return 0;
  return 1 + count_nodes(node->left_child.get()) +
         count_nodes(node->right_child.get());
}

size_t node_depth(const Node *node) {
  if (!node || node->is_leaf)
    return 0;
  return 1 + std::max(node_depth(node->left_child.get()),
                      node_depth(node->right_child.get()));
}

} // namespace

void RegressionTree::fit(const std::vector<std::vector<double>> &features,
                         const std::vector<double> &targets,
                         const TreeParams &params) {
  root_.reset();
  if (features.empty() || features.size() != targets.size())
    return;

  std::vector<size_t> indices(features.size());
  for (size_t i = 0; i < indices.size(); ++i)
    indices[i] = i;

  root_ = build_recursive(features, targets, indices, 0, params);
}

std::unique_ptr<Node> RegressionTree::build_recursive(
    const std::vector<std::vector<double>> &features,
    const std::vector<double> &targets, std::vector<size_t> &indices,
    size_t depth, const TreeParams &params) const {
  auto node = std::make_unique<Node>();
  node->prediction_value = leaf_mean(targets, indices);

  const size_t min_leaf = std::max<size_t>(params.min_samples_leaf, 1);
  const size_t n = indices.size();
  if (depth >= params.max_depth || n < 2 * min_leaf) {
    node->is_leaf = true;
    return node;
  }

  const double parent_sse = sum_squared_error(targets, indices);
  if (parent_sse <= 0.0) {
    node->is_leaf = true;
    return node;
  }

  SplitCandidate best;
  const size_t feature_count = features[indices.front()].size();
  std::vector<size_t> sorted = indices;

  for (size_t f = 0; f < feature_count; ++f) {
    std::sort(sorted.begin(), sorted.end(), [&](size_t a, size_t b) {
      return features[a][f] < features[b][f];
    });

    double total_sum = 0.0, total_sq = 0.0;
    for (size_t idx : sorted) {
      total_sum += targets[idx];
      total_sq += targets[idx] * targets[idx];
    }

    double left_sum = 0.0, left_sq = 0.0;
    for (size_t i = 0; i + 1 < n; ++i) {
      const double y = targets[sorted[i]];
      left_sum += y;
      left_sq += y * y;

      const size_t left_n = i + 1;
      const size_t right_n = n - left_n;
      if (left_n < min_leaf || right_n < min_leaf)
        continue;

      const double x_here = features[sorted[i]][f];
      const double x_next = features[sorted[i + 1]][f];
      if (!(x_here < x_next))
        continue; // Cannot separate equal feature values

      const double right_sum = total_sum - left_sum;
      const double right_sq = total_sq - left_sq;
      const double sse = (left_sq - left_sum * left_sum / left_n) +
                         (right_sq - right_sum * right_sum / right_n);

      if (sse < best.sse) {
        best.sse = sse;
        best.feature_index = static_cast<int>(f);
        best.split_value = x_here + (x_next - x_here) / 2.0;
      }
    }
  }

  if (best.feature_index < 0 || !(best.sse < parent_sse)) {
    node->is_leaf = true;
    return node;
  }

  std::vector<size_t> left_indices, right_indices;
  for (size_t idx : indices) {
    if (features[idx][best.feature_index] < best.split_value)
      left_indices.push_back(idx);
    else
      right_indices.push_back(idx);
  }

  // Midpoints of very close values can round onto one side
  if (left_indices.empty() || right_indices.empty()) {
    node->is_leaf = true;
    return node;
  }

  node->feature_index = best.feature_index;
  node->split_value = best.split_value;
  node->left_child =
      build_recursive(features, targets, left_indices, depth + 1, params);
  node->right_child =
      build_recursive(features, targets, right_indices, depth + 1, params);
  return node;
}

double RegressionTree::predict(const std::vector<double> &features) const {
  if (!root_)
    return 0.0;
  return predict_recursive(root_.get(), features);
}

double
RegressionTree::predict_recursive(const Node *node,
                                  const std::vector<double> &features) const {
  if (node->is_leaf)
    return node->prediction_value;

  // Bounds check to prevent crashes if the feature vector is malformed.
  if (node->feature_index < 0 ||
      static_cast<size_t>(node->feature_index) >= features.size())
    return node->prediction_value;

  if (features[node->feature_index] < node->split_value)
    return predict_recursive(node->left_child.get(), features);
  else
    return predict_recursive(node->right_child.get(), features);
}

size_t RegressionTree::node_count() const { return count_nodes(root_.get()); }

size_t RegressionTree::depth() const { return node_depth(root_.get()); }
