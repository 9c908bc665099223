#include "models/power_predictor.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "models/features.hpp"
#include "models/gradient_boosted_model.hpp"
#include "models/linear_regression_model.hpp"
#include "utils/scoped_timer.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

std::unique_ptr<IPowerRegressor>
make_power_regressor(const Config::PredictiveConfig &config) {
  switch (config.model_type) {
  case Config::ModelType::LINEAR:
    return std::make_unique<LinearRegressionModel>(config.ridge_lambda);
  case Config::ModelType::GRADIENT_BOOSTING:
  default: {
    BoostingParams params;
    params.num_trees = config.num_trees;
    params.learning_rate = config.learning_rate;
    params.tree.max_depth = config.max_depth;
    params.tree.min_samples_leaf = config.min_samples_leaf;
    return std::make_unique<GradientBoostedModel>(params);
  }
  }
}

PowerPredictor::PowerPredictor(const Config::PredictiveConfig &config,
                               ModelFactory factory)
    : config_(config), factory_(std::move(factory)) {
  LOG(LogLevel::INFO, LogComponent::ML_TRAINING,
      "PowerPredictor created with model type "
          << Config::model_type_to_string(config_.model_type)
          << (factory_ ? " (custom factory)" : ""));
  background_thread_ =
      std::thread(&PowerPredictor::background_thread_func, this);
}

PowerPredictor::~PowerPredictor() {
  LOG(LogLevel::DEBUG, LogComponent::ML_TRAINING,
      "Shutting down PowerPredictor...");
  {
    std::lock_guard<std::mutex> lock(cv_mutex_);
    shutdown_flag_ = true;
  }
  cv_.notify_one();
  if (background_thread_.joinable())
    background_thread_.join();
}

std::unique_ptr<IPowerRegressor> PowerPredictor::create_regressor() const {
  if (factory_)
    return factory_();
  std::lock_guard<std::mutex> lock(config_mutex_);
  return make_power_regressor(config_);
}

void PowerPredictor::fit(const std::vector<FeatureRecord> &records,
                         uint64_t trained_at_ms) {
  auto &metrics = DetectorMetrics::instance();
  try {
    fit_and_swap(records, trained_at_ms);
  } catch (const std::exception &) {
    ++trainings_failed_;
    metrics.trainings_failed.Increment();
    throw;
  }
  ++trainings_completed_;
  metrics.trainings_succeeded.Increment();
}

void PowerPredictor::fit_and_swap(const std::vector<FeatureRecord> &records,
                                  uint64_t trained_at_ms) {
  size_t min_training_size;
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    min_training_size = config_.min_training_size;
  }
  if (records.size() < min_training_size)
    throw InsufficientDataError(
        "need " + std::to_string(min_training_size) +
        " records to train, have " + std::to_string(records.size()));

  std::vector<std::vector<double>> features;
  std::vector<double> targets;
  features.reserve(records.size());
  targets.reserve(records.size());
  for (const auto &record : records) {
    features.push_back(build_feature_vector(record));
    targets.push_back(record.power);
  }

  auto model = create_regressor();
  if (!model)
    throw TrainingError("model factory returned no regressor");

  {
    ScopedTimer timer(DetectorMetrics::instance().training_duration_seconds);
    model->fit(features, targets);
  }

  auto trained = std::make_shared<TrainedModel>();
  trained->model = std::shared_ptr<const IPowerRegressor>(std::move(model));
  trained->trained_at_ms = trained_at_ms;
  trained->training_rows = records.size();

  {
    std::lock_guard<std::mutex> lock(model_mutex_);
    active_model_ = std::move(trained);
  }
  DetectorMetrics::instance().model_ready.Set(1);

  LOG(LogLevel::INFO, LogComponent::ML_TRAINING,
      "Power model retrained on " << records.size()
                                  << " records. New model is now active.");
}

void PowerPredictor::train_in_background(
    const std::vector<FeatureRecord> &records, uint64_t trained_at_ms) {
  try {
    fit(records, trained_at_ms);
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::ML_TRAINING,
        "Model training failed: " << e.what()
                                  << ". Keeping the previous model.");
  }
}

bool PowerPredictor::fit_async(std::vector<FeatureRecord> records,
                               uint64_t trained_at_ms) {
  {
    std::lock_guard<std::mutex> lock(cv_mutex_);
    if (training_in_flight_ || shutdown_flag_)
      return false;
    training_in_flight_ = true;
    pending_job_ = PendingJob{std::move(records), trained_at_ms};
  }
  cv_.notify_one();
  LOG(LogLevel::DEBUG, LogComponent::ML_TRAINING,
      "Queued background model training.");
  return true;
}

void PowerPredictor::background_thread_func() {
  LOG(LogLevel::DEBUG, LogComponent::ML_TRAINING,
      "Background training thread started.");
  while (true) {
    PendingJob job;
    {
      std::unique_lock<std::mutex> lock(cv_mutex_);
      cv_.wait(lock, [this] { return shutdown_flag_ || pending_job_; });
      if (shutdown_flag_ && !pending_job_)
        break;
      job = std::move(*pending_job_);
      pending_job_.reset();
    }

    train_in_background(job.records, job.trained_at_ms);

    {
      std::lock_guard<std::mutex> lock(cv_mutex_);
      training_in_flight_ = false;
    }
    idle_cv_.notify_all();
  }
  LOG(LogLevel::DEBUG, LogComponent::ML_TRAINING,
      "Background training thread finished.");
}

void PowerPredictor::wait_until_idle() {
  std::unique_lock<std::mutex> lock(cv_mutex_);
  idle_cv_.wait(lock, [this] { return !training_in_flight_; });
}

double PowerPredictor::predict(double voltage, double current) const {
  auto active = get_active_model();
  if (!active || !active->model)
    throw ModelNotReadyError("no power model has been trained yet");

  const double prediction =
      active->model->predict(build_query_feature_vector(voltage, current));
  if (!std::isfinite(prediction))
    throw std::runtime_error("model produced a non-finite prediction");

  LOG(LogLevel::TRACE, LogComponent::ML_INFERENCE,
      "Predicted " << prediction << "W for " << voltage << "V, " << current
                   << "A");
  return prediction;
}

bool PowerPredictor::is_ready() const {
  std::lock_guard<std::mutex> lock(model_mutex_);
  return active_model_ != nullptr;
}

std::optional<uint64_t> PowerPredictor::last_trained_ms() const {
  std::lock_guard<std::mutex> lock(model_mutex_);
  if (!active_model_)
    return std::nullopt;
  return active_model_->trained_at_ms;
}

std::shared_ptr<const TrainedModel> PowerPredictor::get_active_model() const {
  std::lock_guard<std::mutex> lock(model_mutex_);
  return active_model_;
}

void PowerPredictor::reconfigure(const Config::PredictiveConfig &new_config) {
  std::lock_guard<std::mutex> lock(config_mutex_);
  config_ = new_config;
  LOG(LogLevel::INFO, LogComponent::ML_TRAINING,
      "PowerPredictor reconfigured. Model type "
          << Config::model_type_to_string(config_.model_type)
          << " applies from the next retrain.");
}
