#ifndef POWER_PREDICTOR_HPP
#define POWER_PREDICTOR_HPP

#include "core/config.hpp"
#include "core/telemetry_sample.hpp"
#include "models/base_model.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

// A fitted model together with the instant it was trained. Published as one
// unit so readers never observe a model paired with a stale timestamp.
struct TrainedModel {
  std::shared_ptr<const IPowerRegressor> model;
  uint64_t trained_at_ms = 0;
  size_t training_rows = 0;
};

std::unique_ptr<IPowerRegressor>
make_power_regressor(const Config::PredictiveConfig &config);

// Owns the active power model and its retraining. Fits always run on a
// fresh regressor; the active model is only replaced after a fit succeeds.
class PowerPredictor {
public:
  using ModelFactory = std::function<std::unique_ptr<IPowerRegressor>()>;

  // An empty factory builds the regressor named by config.model_type
  explicit PowerPredictor(const Config::PredictiveConfig &config,
                          ModelFactory factory = nullptr);
  ~PowerPredictor();

  PowerPredictor(const PowerPredictor &) = delete;
  PowerPredictor &operator=(const PowerPredictor &) = delete;

  // Throws InsufficientDataError or TrainingError; the active model is
  // untouched on failure.
  void fit(const std::vector<FeatureRecord> &records, uint64_t trained_at_ms);

  // Hands the fit to the background thread. Returns false if a fit is
  // already in flight.
  bool fit_async(std::vector<FeatureRecord> records, uint64_t trained_at_ms);

  // Throws ModelNotReadyError before the first successful fit
  double predict(double voltage, double current) const;

  bool is_ready() const;
  std::optional<uint64_t> last_trained_ms() const;
  std::shared_ptr<const TrainedModel> get_active_model() const;

  bool is_training() const { return training_in_flight_.load(); }
  uint64_t training_count() const { return trainings_completed_.load(); }
  uint64_t failure_count() const { return trainings_failed_.load(); }

  // Blocks until no fit is queued or running
  void wait_until_idle();

  void reconfigure(const Config::PredictiveConfig &new_config);

private:
  struct PendingJob {
    std::vector<FeatureRecord> records;
    uint64_t trained_at_ms = 0;
  };

  void background_thread_func();
  void fit_and_swap(const std::vector<FeatureRecord> &records,
                    uint64_t trained_at_ms);
  void train_in_background(const std::vector<FeatureRecord> &records,
                           uint64_t trained_at_ms);
  std::unique_ptr<IPowerRegressor> create_regressor() const;

  Config::PredictiveConfig config_;
  ModelFactory factory_;
  mutable std::mutex config_mutex_;

  std::shared_ptr<const TrainedModel> active_model_;
  mutable std::mutex model_mutex_;

  std::optional<PendingJob> pending_job_;
  std::atomic<bool> training_in_flight_{false};
  std::atomic<uint64_t> trainings_completed_{0};
  std::atomic<uint64_t> trainings_failed_{0};

  std::thread background_thread_;
  std::atomic<bool> shutdown_flag_{false};
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::mutex cv_mutex_;
};

#endif // POWER_PREDICTOR_HPP
