#include "stat_summary.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

StatSummary compute_stat_summary(std::vector<double> values) {
  if (values.size() < 2)
    throw InsufficientDataError("stat summary needs at least 2 values, got " +
                                std::to_string(values.size()));

  std::sort(values.begin(), values.end());

  const double n = static_cast<double>(values.size());
  double sum = 0.0;
  for (double v : values)
    sum += v;
  const double mean = sum / n;

  double squared_deviations = 0.0;
  for (double v : values)
    squared_deviations += (v - mean) * (v - mean);

  StatSummary summary;
  summary.count = values.size();
  summary.mean = mean;
  summary.stddev = std::sqrt(squared_deviations / n);
  summary.min = values.front();
  summary.max = values.back();
  summary.q1 = values[static_cast<size_t>(n * 0.25)];
  summary.q3 = values[static_cast<size_t>(n * 0.75)];
  return summary;
}
