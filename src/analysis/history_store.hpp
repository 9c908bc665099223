#ifndef HISTORY_STORE_HPP
#define HISTORY_STORE_HPP

#include "core/telemetry_sample.hpp"

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

enum class Metric { VOLTAGE, CURRENT, POWER, POWER_FACTOR, EFFICIENCY };

std::string metric_to_string(Metric metric);
double metric_value(const FeatureRecord &record, Metric metric);

// Insertion-ordered, capacity-bounded buffer of feature records. Appends go
// to the back; once the capacity is exceeded the oldest record is evicted.
// Not synchronized: the owning engine serializes access.
class HistoryStore {
public:
  explicit HistoryStore(size_t capacity = 1000);

  void append(const FeatureRecord &record);

  size_t size() const { return records_.size(); }
  size_t capacity() const { return capacity_; }
  bool is_empty() const { return records_.empty(); }

  // One metric of every record, oldest first
  std::vector<double> projection(Metric metric) const;

  // The window a new sample is judged against: the records that survive its
  // append (the oldest drops out when full) followed by `incoming`.
  std::vector<double> baseline_projection(Metric metric, double incoming) const;
  size_t baseline_size() const;

  std::vector<FeatureRecord> snapshot() const;

private:
  std::deque<FeatureRecord> records_;
  size_t capacity_;
};

#endif // HISTORY_STORE_HPP
