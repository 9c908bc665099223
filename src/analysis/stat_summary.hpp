#ifndef STAT_SUMMARY_HPP
#define STAT_SUMMARY_HPP

#include <cstddef>
#include <vector>

struct StatSummary {
  size_t count = 0;
  double mean = 0.0;
  double stddev = 0.0; // population
  double min = 0.0;
  double max = 0.0;
  double q1 = 0.0;
  double q3 = 0.0;

  double iqr() const { return q3 - q1; }
};

// Mean and population standard deviation plus nearest-rank quartiles
// (sorted[floor(n * 0.25)] and sorted[floor(n * 0.75)], no interpolation).
// Throws InsufficientDataError for fewer than two values.
StatSummary compute_stat_summary(std::vector<double> values);

#endif // STAT_SUMMARY_HPP
