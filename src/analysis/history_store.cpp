#include "history_store.hpp"

#include <algorithm>
#include <cstddef>

std::string metric_to_string(Metric metric) {
  switch (metric) {
  case Metric::VOLTAGE:
    return "voltage";
  case Metric::CURRENT:
    return "current";
  case Metric::POWER:
    return "power";
  case Metric::POWER_FACTOR:
    return "power_factor";
  case Metric::EFFICIENCY:
    return "efficiency";
  }
  return "unknown";
}

double metric_value(const FeatureRecord &record, Metric metric) {
  switch (metric) {
  case Metric::VOLTAGE:
    return record.voltage;
  case Metric::CURRENT:
    return record.current;
  case Metric::POWER:
    return record.power;
  case Metric::POWER_FACTOR:
    return record.power_factor;
  case Metric::EFFICIENCY:
    return record.efficiency;
  }
  return 0.0;
}

HistoryStore::HistoryStore(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

void HistoryStore::append(const FeatureRecord &record) {
  records_.push_back(record);
  while (records_.size() > capacity_)
    records_.pop_front();
}

std::vector<double> HistoryStore::projection(Metric metric) const {
  std::vector<double> values;
  values.reserve(records_.size());
  for (const auto &record : records_)
    values.push_back(metric_value(record, metric));
  return values;
}

std::vector<double> HistoryStore::baseline_projection(Metric metric,
                                                     double incoming) const {
  auto first = records_.begin();
  if (records_.size() >= capacity_)
    first += static_cast<std::ptrdiff_t>(records_.size() - capacity_ + 1);

  std::vector<double> values;
  values.reserve(baseline_size());
  for (auto it = first; it != records_.end(); ++it)
    values.push_back(metric_value(*it, metric));
  values.push_back(incoming);
  return values;
}

size_t HistoryStore::baseline_size() const {
  return std::min(records_.size() + 1, capacity_);
}

std::vector<FeatureRecord> HistoryStore::snapshot() const {
  return std::vector<FeatureRecord>(records_.begin(), records_.end());
}
