#ifndef ANOMALY_ENGINE_HPP
#define ANOMALY_ENGINE_HPP

#include "analysis/history_store.hpp"
#include "analysis/predictive_detector.hpp"
#include "analysis/statistical_detector.hpp"
#include "core/config.hpp"
#include "core/finding.hpp"
#include "core/telemetry_sample.hpp"
#include "models/power_predictor.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

struct EngineStatus {
  size_t history_size = 0;
  bool model_trained = false;
  std::optional<uint64_t> last_trained_ms;
  uint64_t trainings_completed = 0;
};

// The anomaly detection pipeline shared by every device: one history, one
// statistical detector, one predictive model. Each ingest is serialized by a
// single mutex; model fits may run on the predictor's background thread.
class AnomalyEngine {
public:
  // Milliseconds since the epoch; drives the retraining interval
  using Clock = std::function<uint64_t()>;

  explicit AnomalyEngine(const Config::AppConfig &cfg, Clock clock = nullptr,
                         PowerPredictor::ModelFactory factory = nullptr);
  ~AnomalyEngine();

  AnomalyEngine(const AnomalyEngine &) = delete;
  AnomalyEngine &operator=(const AnomalyEngine &) = delete;

  // Detects against the recorded history plus this sample, then records the
  // sample and retrains if due. Never throws.
  std::vector<Finding> ingest(const TelemetrySample &sample);

  EngineStatus status() const;

  // Oldest first
  std::vector<FeatureRecord> get_history_snapshot() const;

  // Blocks until a background retrain, if any, has finished
  void wait_for_training_idle();

  // History capacity changes need a restart; everything else applies now
  void reconfigure(const Config::AppConfig &new_config);

  const PowerPredictor &get_predictor() const { return *predictor_; }

private:
  bool should_retrain(uint64_t now_ms) const;
  void start_retrain(uint64_t now_ms);

  Config::PredictiveConfig predictive_config_;
  Clock clock_;

  mutable std::mutex mutex_;
  HistoryStore history_;
  StatisticalDetector statistical_detector_;
  PredictiveDetector predictive_detector_;
  std::unique_ptr<PowerPredictor> predictor_;
};

#endif // ANOMALY_ENGINE_HPP
