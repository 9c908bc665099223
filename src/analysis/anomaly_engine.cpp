#include "anomaly_engine.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/scoped_timer.hpp"
#include "utils/utils.hpp"

#include <utility>

AnomalyEngine::AnomalyEngine(const Config::AppConfig &cfg, Clock clock,
                             PowerPredictor::ModelFactory factory)
    : predictive_config_(cfg.predictive),
      clock_(clock ? std::move(clock) : Clock(&Utils::get_current_time_ms)),
      history_(cfg.history.capacity),
      statistical_detector_(cfg.statistical),
      predictive_detector_(cfg.predictive),
      predictor_(std::make_unique<PowerPredictor>(cfg.predictive,
                                                  std::move(factory))) {
  LOG(LogLevel::INFO, LogComponent::ENGINE_LIFECYCLE,
      "AnomalyEngine created. History capacity "
          << history_.capacity() << ", training floor "
          << predictive_config_.min_training_size << ", retrain interval "
          << predictive_config_.retrain_interval_seconds << "s ("
          << (predictive_config_.async_retraining ? "async" : "sync") << ").");
}

AnomalyEngine::~AnomalyEngine() {
  LOG(LogLevel::INFO, LogComponent::ENGINE_LIFECYCLE,
      "AnomalyEngine shutting down with " << history_.size()
                                          << " records in history.");
}

std::vector<Finding> AnomalyEngine::ingest(const TelemetrySample &sample) {
  auto &metrics = DetectorMetrics::instance();
  ScopedTimer timer(metrics.ingest_duration_seconds);
  std::vector<Finding> findings;

  std::lock_guard<std::mutex> lock(mutex_);

  try {
    findings = statistical_detector_.detect(sample, history_);
    // Baseline sizes count the sample under test
    if (auto predictive = predictive_detector_.detect(
            sample, history_.baseline_size(), *predictor_))
      findings.push_back(std::move(*predictive));
  } catch (const std::exception &e) {
    metrics.ingest_faults.Increment();
    LOG(LogLevel::ERROR, LogComponent::ENGINE_LIFECYCLE,
        "Detection failed for device " << sample.device_id << ": "
                                       << e.what());
  }

  try {
    history_.append(make_feature_record(sample));
    metrics.history_size.Set(static_cast<double>(history_.size()));
    LOG(LogLevel::TRACE, LogComponent::ENGINE_HISTORY,
        "Recorded sample from " << sample.device_id << ", history size "
                                << history_.size());

    const uint64_t now_ms = clock_();
    if (should_retrain(now_ms))
      start_retrain(now_ms);
  } catch (const std::exception &e) {
    metrics.ingest_faults.Increment();
    LOG(LogLevel::ERROR, LogComponent::ENGINE_LIFECYCLE,
        "Failed to record sample from " << sample.device_id << ": "
                                        << e.what());
  }

  metrics.samples_ingested.Increment();
  for (const auto &finding : findings)
    metrics
        .finding_counter(detection_method_to_string(finding.method),
                         severity_to_string(finding.severity))
        .Increment();

  return findings;
}

bool AnomalyEngine::should_retrain(uint64_t now_ms) const {
  if (!predictive_config_.enabled ||
      history_.size() < predictive_config_.min_training_size ||
      predictor_->is_training())
    return false;

  auto last_trained = predictor_->last_trained_ms();
  if (!last_trained)
    return true;

  const uint64_t interval_ms =
      predictive_config_.retrain_interval_seconds * 1000;
  return now_ms >= *last_trained && now_ms - *last_trained >= interval_ms;
}

void AnomalyEngine::start_retrain(uint64_t now_ms) {
  LOG(LogLevel::INFO, LogComponent::ENGINE_LIFECYCLE,
      "Retraining power model on " << history_.size() << " records.");

  if (predictive_config_.async_retraining) {
    if (!predictor_->fit_async(history_.snapshot(), now_ms))
      LOG(LogLevel::DEBUG, LogComponent::ENGINE_LIFECYCLE,
          "Retrain already in flight, skipping.");
    return;
  }

  try {
    predictor_->fit(history_.snapshot(), now_ms);
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::ENGINE_LIFECYCLE,
        "Retrain failed: " << e.what()
                           << ". Previous model kept, retrying next sample.");
  }
}

EngineStatus AnomalyEngine::status() const {
  EngineStatus status;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    status.history_size = history_.size();
  }
  auto active = predictor_->get_active_model();
  status.model_trained = active != nullptr;
  if (active)
    status.last_trained_ms = active->trained_at_ms;
  status.trainings_completed = predictor_->training_count();
  return status;
}

std::vector<FeatureRecord> AnomalyEngine::get_history_snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return history_.snapshot();
}

void AnomalyEngine::wait_for_training_idle() { predictor_->wait_until_idle(); }

void AnomalyEngine::reconfigure(const Config::AppConfig &new_config) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (new_config.history.capacity != history_.capacity())
    LOG(LogLevel::WARN, LogComponent::ENGINE_LIFECYCLE,
        "History capacity change to " << new_config.history.capacity
                                      << " requires a restart; keeping "
                                      << history_.capacity() << ".");

  predictive_config_ = new_config.predictive;
  statistical_detector_.reconfigure(new_config.statistical);
  predictive_detector_.reconfigure(new_config.predictive);
  predictor_->reconfigure(new_config.predictive);
  LOG(LogLevel::INFO, LogComponent::ENGINE_LIFECYCLE,
      "AnomalyEngine reconfigured.");
}
