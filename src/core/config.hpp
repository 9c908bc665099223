#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *TELEMETRY_INPUT_PATH = "telemetry_input_path";
constexpr const char *LIVE_MONITORING_ENABLED = "live_monitoring_enabled";
constexpr const char *LIVE_MONITORING_SLEEP_SECONDS =
    "live_monitoring_sleep_seconds";
constexpr const char *WORKER_THREADS = "worker_threads";
constexpr const char *READER_QUEUE_CAPACITY = "reader_queue_capacity";
constexpr const char *STATUS_REPORT_INTERVAL_SAMPLES =
    "status_report_interval_samples";
constexpr const char *ALERTS_TO_STDOUT = "alerts_to_stdout";
constexpr const char *ALERT_OUTPUT_PATH = "alert_output_path";
constexpr const char *ALERT_THROTTLE_DURATION_SECONDS =
    "alert_throttle_duration_seconds";

// History Settings
constexpr const char *HI_CAPACITY = "capacity";

// Statistical Settings
constexpr const char *ST_ENABLED = "enabled";
constexpr const char *ST_MIN_SAMPLES = "min_samples";
constexpr const char *ST_Z_SCORE_THRESHOLD = "z_score_threshold";
constexpr const char *ST_Z_SCORE_HIGH_THRESHOLD = "z_score_high_threshold";
constexpr const char *ST_IQR_MULTIPLIER = "iqr_multiplier";
constexpr const char *ST_IQR_HIGH_FACTOR = "iqr_high_factor";

// Predictive Settings
constexpr const char *PR_ENABLED = "enabled";
constexpr const char *PR_MIN_TRAINING_SIZE = "min_training_size";
constexpr const char *PR_RETRAIN_INTERVAL_SECONDS = "retrain_interval_seconds";
constexpr const char *PR_ASYNC_RETRAINING = "async_retraining";
constexpr const char *PR_RELATIVE_ERROR_THRESHOLD =
    "relative_error_threshold";
constexpr const char *PR_RELATIVE_ERROR_HIGH_THRESHOLD =
    "relative_error_high_threshold";
constexpr const char *PR_MIN_PREDICTION_DENOMINATOR =
    "min_prediction_denominator";
constexpr const char *PR_MODEL_TYPE = "model_type";
constexpr const char *PR_NUM_TREES = "num_trees";
constexpr const char *PR_LEARNING_RATE = "learning_rate";
constexpr const char *PR_MAX_DEPTH = "max_depth";
constexpr const char *PR_MIN_SAMPLES_LEAF = "min_samples_leaf";
constexpr const char *PR_RIDGE_LAMBDA = "ridge_lambda";

// Alerting Settings
constexpr const char *AL_FILE_ENABLED = "file_enabled";
constexpr const char *AL_HTTP_ENABLED = "http_enabled";
constexpr const char *AL_HTTP_WEBHOOK_URL = "http_webhook_url";
constexpr const char *AL_HTTP_MAX_ATTEMPTS = "http_max_attempts";
constexpr const char *AL_HTTP_RETRY_DELAY_MS = "http_retry_delay_ms";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";

// Monitoring Settings
constexpr const char *MONITORING_WEB_SERVER_ENABLED = "web_server_enabled";
constexpr const char *MONITORING_WEB_SERVER_HOST = "web_server_host";
constexpr const char *MONITORING_WEB_SERVER_PORT = "web_server_port";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct HistoryConfig {
  size_t capacity = 1000;
};

struct StatisticalConfig {
  bool enabled = true;
  // Warm-up floor, distinct from the predictive training floor
  size_t min_samples = 10;
  double z_score_threshold = 2.5;
  double z_score_high_threshold = 3.5;
  double iqr_multiplier = 1.5;
  // An outlier is high severity when it lies further than this many IQRs
  // beyond its fence
  double iqr_high_factor = 2.0;
};

enum class ModelType { GRADIENT_BOOSTING, LINEAR };

struct PredictiveConfig {
  bool enabled = true;
  size_t min_training_size = 50;
  uint64_t retrain_interval_seconds = 1800; // 30 minutes
  bool async_retraining = true;
  double relative_error_threshold = 0.15;
  double relative_error_high_threshold = 0.30;
  double min_prediction_denominator = 1.0;

  ModelType model_type = ModelType::GRADIENT_BOOSTING;
  // Gradient boosting
  uint32_t num_trees = 100;
  double learning_rate = 0.2;
  uint32_t max_depth = 5;
  uint32_t min_samples_leaf = 2;
  // Linear
  double ridge_lambda = 1e-6;
};

struct AlertingConfig {
  bool file_enabled = false;
  bool http_enabled = false;
  std::string http_webhook_url;
  // Connection errors and 5xx responses are retried, 4xx are not
  int http_max_attempts = 3;
  int http_retry_delay_ms = 500;
};

struct MonitoringConfig {
  bool web_server_enabled = false;
  std::string web_server_host = "0.0.0.0";
  int web_server_port = 9090;
};

struct AppConfig {
  std::string telemetry_input_path = "-"; // "-" reads from stdin
  bool live_monitoring_enabled = false;
  uint64_t live_monitoring_sleep_seconds = 1;
  uint32_t worker_threads = 2;
  size_t reader_queue_capacity = 10000;
  uint64_t status_report_interval_samples = 100;

  bool alerts_to_stdout = true;
  std::string alert_output_path = "alerts.json";
  uint64_t alert_throttle_duration_seconds = 0; // 0 disables throttling

  HistoryConfig history;
  StatisticalConfig statistical;
  PredictiveConfig predictive;
  AlertingConfig alerting;
  LoggingConfig logging;
  MonitoringConfig monitoring;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

std::string model_type_to_string(ModelType type);

// Validation functions for configuration parameters
bool validate_statistical_config(const StatisticalConfig &config,
                                 std::vector<std::string> &errors);
bool validate_predictive_config(const PredictiveConfig &config,
                                std::vector<std::string> &errors);
bool validate_monitoring_config(const MonitoringConfig &config,
                                std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
