#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"io.reader", LogComponent::IO_READER},
    {"io.dispatch", LogComponent::IO_DISPATCH},
    {"io.web", LogComponent::IO_WEB},
    {"engine.lifecycle", LogComponent::ENGINE_LIFECYCLE},
    {"engine.history", LogComponent::ENGINE_HISTORY},
    {"detect.statistical", LogComponent::DETECT_STATISTICAL},
    {"detect.predictive", LogComponent::DETECT_PREDICTIVE},
    {"ml.training", LogComponent::ML_TRAINING},
    {"ml.inference", LogComponent::ML_INFERENCE}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::trim_copy(val_str_raw);
  std::transform(val_str.begin(), val_str.end(), val_str.begin(), ::tolower);
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

std::optional<ModelType> string_to_model_type(const std::string &raw) {
  std::string val = Utils::trim_copy(raw);
  std::transform(val.begin(), val.end(), val.begin(), ::tolower);
  if (val == "gradient_boosting" || val == "gbt")
    return ModelType::GRADIENT_BOOSTING;
  if (val == "linear")
    return ModelType::LINEAR;
  return std::nullopt;
}

std::string model_type_to_string(ModelType type) {
  switch (type) {
  case ModelType::GRADIENT_BOOSTING:
    return "gradient_boosting";
  case ModelType::LINEAR:
    return "linear";
  }
  return "unknown";
}

bool validate_statistical_config(const StatisticalConfig &config,
                                 std::vector<std::string> &errors) {
  bool valid = true;

  // The Z-score needs a standard deviation, which needs at least two points
  if (config.min_samples < 2) {
    errors.push_back("Statistical min_samples must be at least 2");
    valid = false;
  }

  if (config.z_score_threshold <= 0.0) {
    errors.push_back("Statistical z_score_threshold must be positive");
    valid = false;
  }

  if (config.z_score_high_threshold < config.z_score_threshold) {
    errors.push_back("Statistical z_score_high_threshold must not be below "
                     "z_score_threshold");
    valid = false;
  }

  if (config.iqr_multiplier <= 0.0) {
    errors.push_back("Statistical iqr_multiplier must be positive");
    valid = false;
  }

  if (config.iqr_high_factor < 0.0) {
    errors.push_back("Statistical iqr_high_factor must not be negative");
    valid = false;
  }

  return valid;
}

bool validate_predictive_config(const PredictiveConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (config.min_training_size < 2) {
    errors.push_back("Predictive min_training_size must be at least 2");
    valid = false;
  }

  if (config.relative_error_threshold <= 0.0) {
    errors.push_back("Predictive relative_error_threshold must be positive");
    valid = false;
  }

  if (config.relative_error_high_threshold < config.relative_error_threshold) {
    errors.push_back("Predictive relative_error_high_threshold must not be "
                     "below relative_error_threshold");
    valid = false;
  }

  if (config.min_prediction_denominator <= 0.0) {
    errors.push_back("Predictive min_prediction_denominator must be positive");
    valid = false;
  }

  if (config.num_trees < 1 || config.num_trees > 5000) {
    errors.push_back("Predictive num_trees must be between 1 and 5000");
    valid = false;
  }

  if (config.learning_rate <= 0.0 || config.learning_rate > 1.0) {
    errors.push_back("Predictive learning_rate must be in (0, 1]");
    valid = false;
  }

  if (config.max_depth < 1 || config.max_depth > 16) {
    errors.push_back("Predictive max_depth must be between 1 and 16");
    valid = false;
  }

  if (config.min_samples_leaf < 1) {
    errors.push_back("Predictive min_samples_leaf must be at least 1");
    valid = false;
  }

  if (config.ridge_lambda < 0.0) {
    errors.push_back("Predictive ridge_lambda must not be negative");
    valid = false;
  }

  return valid;
}

bool validate_monitoring_config(const MonitoringConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (config.web_server_port < 1 || config.web_server_port > 65535) {
    errors.push_back("Monitoring web_server_port must be between 1 and 65535");
    valid = false;
  }

  if (config.web_server_enabled && config.web_server_host.empty()) {
    errors.push_back(
        "Monitoring web_server_host cannot be empty when the server is "
        "enabled");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (config.history.capacity < 1) {
    errors.push_back("History capacity must be at least 1");
    valid = false;
  }

  if (config.predictive.enabled &&
      config.predictive.min_training_size > config.history.capacity) {
    errors.push_back("Predictive min_training_size cannot exceed the history "
                     "capacity, the model would never train");
    valid = false;
  }

  if (config.worker_threads < 1 || config.worker_threads > 64) {
    errors.push_back("worker_threads must be between 1 and 64");
    valid = false;
  }

  if (config.reader_queue_capacity < 1) {
    errors.push_back("reader_queue_capacity must be at least 1");
    valid = false;
  }

  if (config.alerting.http_enabled && config.alerting.http_webhook_url.empty()) {
    errors.push_back(
        "Alerting http_webhook_url cannot be empty when HTTP alerts are "
        "enabled");
    valid = false;
  }

  if (config.alerting.http_max_attempts < 1 ||
      config.alerting.http_max_attempts > 10) {
    errors.push_back("Alerting http_max_attempts must be between 1 and 10");
    valid = false;
  }

  if (config.alerting.http_retry_delay_ms < 0) {
    errors.push_back("Alerting http_retry_delay_ms cannot be negative");
    valid = false;
  }

  valid &= validate_statistical_config(config.statistical, errors);
  valid &= validate_predictive_config(config.predictive, errors);
  valid &= validate_monitoring_config(config.monitoring, errors);

  return valid;
}

template <typename T>
void assign_number(T &field, const std::string &value, int line_num,
                   const std::string &key) {
  if (auto parsed = Utils::string_to_number<T>(value))
    field = *parsed;
  else
    std::cerr << "Warning (Config Line " << line_num << "): Invalid number '"
              << value << "' for key '" << key << "'. Keeping "
              << field << "." << std::endl;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map) {
    config.logging.log_levels[pair.second] = LogLevel::WARN;
  }
  // Except for CORE, which we want to see INFO messages from by default
  config.logging.log_levels[LogComponent::CORE] = LogLevel::INFO;

  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    // Global (non-section) keys
    if (current_section.empty()) {
      if (key == Keys::TELEMETRY_INPUT_PATH)
        config.telemetry_input_path = value;
      else if (key == Keys::LIVE_MONITORING_ENABLED)
        config.live_monitoring_enabled = string_to_bool(value);
      else if (key == Keys::LIVE_MONITORING_SLEEP_SECONDS)
        assign_number(config.live_monitoring_sleep_seconds, value, line_num,
                      key);
      else if (key == Keys::WORKER_THREADS)
        assign_number(config.worker_threads, value, line_num, key);
      else if (key == Keys::READER_QUEUE_CAPACITY)
        assign_number(config.reader_queue_capacity, value, line_num, key);
      else if (key == Keys::STATUS_REPORT_INTERVAL_SAMPLES)
        assign_number(config.status_report_interval_samples, value, line_num,
                      key);
      else if (key == Keys::ALERTS_TO_STDOUT)
        config.alerts_to_stdout = string_to_bool(value);
      else if (key == Keys::ALERT_OUTPUT_PATH)
        config.alert_output_path = value;
      else if (key == Keys::ALERT_THROTTLE_DURATION_SECONDS)
        assign_number(config.alert_throttle_duration_seconds, value, line_num,
                      key);
      else
        config.custom_settings[key] = value;

    } else if (current_section == "History") {
      if (key == Keys::HI_CAPACITY)
        assign_number(config.history.capacity, value, line_num, key);

    } else if (current_section == "Statistical") {
      auto &st = config.statistical;
      if (key == Keys::ST_ENABLED)
        st.enabled = string_to_bool(value);
      else if (key == Keys::ST_MIN_SAMPLES)
        assign_number(st.min_samples, value, line_num, key);
      else if (key == Keys::ST_Z_SCORE_THRESHOLD)
        assign_number(st.z_score_threshold, value, line_num, key);
      else if (key == Keys::ST_Z_SCORE_HIGH_THRESHOLD)
        assign_number(st.z_score_high_threshold, value, line_num, key);
      else if (key == Keys::ST_IQR_MULTIPLIER)
        assign_number(st.iqr_multiplier, value, line_num, key);
      else if (key == Keys::ST_IQR_HIGH_FACTOR)
        assign_number(st.iqr_high_factor, value, line_num, key);

    } else if (current_section == "Predictive") {
      auto &pr = config.predictive;
      if (key == Keys::PR_ENABLED)
        pr.enabled = string_to_bool(value);
      else if (key == Keys::PR_MIN_TRAINING_SIZE)
        assign_number(pr.min_training_size, value, line_num, key);
      else if (key == Keys::PR_RETRAIN_INTERVAL_SECONDS)
        assign_number(pr.retrain_interval_seconds, value, line_num, key);
      else if (key == Keys::PR_ASYNC_RETRAINING)
        pr.async_retraining = string_to_bool(value);
      else if (key == Keys::PR_RELATIVE_ERROR_THRESHOLD)
        assign_number(pr.relative_error_threshold, value, line_num, key);
      else if (key == Keys::PR_RELATIVE_ERROR_HIGH_THRESHOLD)
        assign_number(pr.relative_error_high_threshold, value, line_num, key);
      else if (key == Keys::PR_MIN_PREDICTION_DENOMINATOR)
        assign_number(pr.min_prediction_denominator, value, line_num, key);
      else if (key == Keys::PR_MODEL_TYPE) {
        if (auto type = string_to_model_type(value))
          pr.model_type = *type;
        else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown model_type '" << value << "'. Keeping "
                    << model_type_to_string(pr.model_type) << "."
                    << std::endl;
      } else if (key == Keys::PR_NUM_TREES)
        assign_number(pr.num_trees, value, line_num, key);
      else if (key == Keys::PR_LEARNING_RATE)
        assign_number(pr.learning_rate, value, line_num, key);
      else if (key == Keys::PR_MAX_DEPTH)
        assign_number(pr.max_depth, value, line_num, key);
      else if (key == Keys::PR_MIN_SAMPLES_LEAF)
        assign_number(pr.min_samples_leaf, value, line_num, key);
      else if (key == Keys::PR_RIDGE_LAMBDA)
        assign_number(pr.ridge_lambda, value, line_num, key);

    } else if (current_section == "Alerting") {
      if (key == Keys::AL_FILE_ENABLED)
        config.alerting.file_enabled = string_to_bool(value);
      else if (key == Keys::AL_HTTP_ENABLED)
        config.alerting.http_enabled = string_to_bool(value);
      else if (key == Keys::AL_HTTP_WEBHOOK_URL)
        config.alerting.http_webhook_url = value;
      else if (key == Keys::AL_HTTP_MAX_ATTEMPTS)
        assign_number(config.alerting.http_max_attempts, value, line_num, key);
      else if (key == Keys::AL_HTTP_RETRY_DELAY_MS)
        assign_number(config.alerting.http_retry_delay_ms, value, line_num,
                      key);

    } else if (current_section == "Monitoring") {
      if (key == Keys::MONITORING_WEB_SERVER_ENABLED)
        config.monitoring.web_server_enabled = string_to_bool(value);
      else if (key == Keys::MONITORING_WEB_SERVER_HOST)
        config.monitoring.web_server_host = value;
      else if (key == Keys::MONITORING_WEB_SERVER_PORT)
        assign_number(config.monitoring.web_server_port, value, line_num, key);

    } else if (current_section == "Logging") {
      if (key == Keys::LOGGING_DEFAULT_LEVEL) {
        LogLevel default_level = string_to_log_level(value);
        for (auto &pair : config.logging.log_levels)
          pair.second = default_level;
      } else {
        auto it = key_to_component_map.find(key);
        if (it != key_to_component_map.end())
          config.logging.log_levels[it->second] = string_to_log_level(value);
        else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown logging component '" << key << "'."
                    << std::endl;
      }
    } else {
      std::cerr << "Warning (Config Line " << line_num << "): Unknown section '"
                << current_section << "'." << std::endl;
    }
  }

  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
