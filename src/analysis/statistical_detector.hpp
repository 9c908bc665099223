#ifndef STATISTICAL_DETECTOR_HPP
#define STATISTICAL_DETECTOR_HPP

#include "analysis/history_store.hpp"
#include "analysis/stat_summary.hpp"
#include "core/config.hpp"
#include "core/finding.hpp"
#include "core/telemetry_sample.hpp"

#include <vector>

// Z-score rule on voltage, current and power plus an IQR fence on power.
// The baseline is the history window the sample will land in, sample
// included, so a lone spike against a flat history still has a spread to be
// measured by. A full history contributes all but its oldest record.
class StatisticalDetector {
public:
  explicit StatisticalDetector(const Config::StatisticalConfig &config);

  // Findings are ordered voltage, current, power (Z-score), power (IQR).
  // `history` must not contain the sample yet. Returns nothing while the
  // baseline (history plus sample) is below the warm-up floor.
  std::vector<Finding> detect(const TelemetrySample &sample,
                              const HistoryStore &history) const;

  void reconfigure(const Config::StatisticalConfig &config);

  // |value - mean| / stddev, or 0 when the metric has no spread
  static double z_score(double value, const StatSummary &summary);

private:
  void check_z_score(Metric metric, double value, const HistoryStore &history,
                     std::vector<Finding> &findings) const;
  void check_power_iqr(double power, const StatSummary &power_stats,
                       std::vector<Finding> &findings) const;

  Config::StatisticalConfig config_;
  SeverityThresholds thresholds_;
};

#endif // STATISTICAL_DETECTOR_HPP
