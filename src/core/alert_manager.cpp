#include "alert_manager.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "io/alert_dispatch/file_dispatcher.hpp"
#include "io/alert_dispatch/http_dispatcher.hpp"
#include "utils/utils.hpp"

#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>

AlertManager::AlertManager() {
  LOG(LogLevel::DEBUG, LogComponent::IO_DISPATCH, "AlertManager created");
}

AlertManager::~AlertManager() {
  alert_queue_.shutdown();
  if (dispatcher_thread_.joinable())
    dispatcher_thread_.join();
  LOG(LogLevel::DEBUG, LogComponent::IO_DISPATCH,
      "AlertManager shut down after recording " << alerts_recorded_.load()
                                                << " alerts.");
}

void AlertManager::initialize(const Config::AppConfig &app_config) {
  reconfigure(app_config);
  if (!dispatcher_thread_.joinable())
    dispatcher_thread_ = std::thread(&AlertManager::dispatcher_loop, this);
}

void AlertManager::reconfigure(const Config::AppConfig &new_config) {
  output_alerts_to_stdout_ = new_config.alerts_to_stdout;
  {
    std::lock_guard<std::mutex> lock(throttle_mutex_);
    throttle_duration_ms_ = new_config.alert_throttle_duration_seconds * 1000;
  }

  std::vector<std::unique_ptr<IAlertDispatcher>> new_dispatchers;
  const auto &alert_cfg = new_config.alerting;

  if (alert_cfg.file_enabled && !new_config.alert_output_path.empty()) {
    new_dispatchers.push_back(
        std::make_unique<FileDispatcher>(new_config.alert_output_path));
    LOG(LogLevel::INFO, LogComponent::IO_DISPATCH,
        "AlertManager: FileDispatcher enabled, outputting to "
            << new_config.alert_output_path);
  }

  if (alert_cfg.http_enabled && !alert_cfg.http_webhook_url.empty()) {
    new_dispatchers.push_back(
        std::make_unique<HttpDispatcher>(alert_cfg.http_webhook_url,
                                         alert_cfg.http_max_attempts,
                                         alert_cfg.http_retry_delay_ms));
    LOG(LogLevel::INFO, LogComponent::IO_DISPATCH,
        "AlertManager: HttpDispatcher enabled for URL: "
            << alert_cfg.http_webhook_url);
  }

  std::lock_guard<std::mutex> lock(dispatchers_mutex_);
  dispatchers_ = std::move(new_dispatchers);
  LOG(LogLevel::INFO, LogComponent::IO_DISPATCH,
      "AlertManager has been reconfigured. Active dispatchers: "
          << dispatchers_.size());
}

void AlertManager::add_dispatcher(
    std::unique_ptr<IAlertDispatcher> dispatcher) {
  std::lock_guard<std::mutex> lock(dispatchers_mutex_);
  dispatchers_.push_back(std::move(dispatcher));
}

bool AlertManager::record_alert(const Alert &new_alert) {
  {
    std::lock_guard<std::mutex> lock(throttle_mutex_);
    if (throttle_duration_ms_ > 0) {
      const std::string key = new_alert.throttle_key();
      auto it = last_alert_timestamps_.find(key);
      if (it != last_alert_timestamps_.end() &&
          new_alert.event_timestamp_ms >= it->second &&
          new_alert.event_timestamp_ms < it->second + throttle_duration_ms_) {
        alerts_throttled_++;
        DetectorMetrics::instance().alerts_throttled.Increment();
        LOG(LogLevel::DEBUG, LogComponent::IO_DISPATCH,
            "Throttled alert " << key << " at "
                               << new_alert.event_timestamp_ms);
        return false;
      }
      last_alert_timestamps_[key] = new_alert.event_timestamp_ms;
    }
  }

  alerts_recorded_++;
  {
    std::lock_guard<std::mutex> lock(recent_alerts_mutex_);
    recent_alerts_.push_front(new_alert);
    if (recent_alerts_.size() > MAX_RECENT_ALERTS)
      recent_alerts_.pop_back();
  }

  if (!alert_queue_.push(new_alert))
    LOG(LogLevel::WARN, LogComponent::IO_DISPATCH,
        "Alert queue is shut down; alert for " << new_alert.device_id
                                               << " not dispatched.");
  return true;
}

size_t AlertManager::record_findings(const TelemetrySample &sample,
                                     const std::vector<Finding> &findings) {
  size_t recorded = 0;
  for (const auto &finding : findings) {
    Alert alert(sample.device_id, sample.timestamp_ms, finding);
    alert.voltage = sample.voltage;
    alert.current = sample.current;
    alert.power = sample.power;
    if (record_alert(alert))
      ++recorded;
  }
  return recorded;
}

std::vector<Alert> AlertManager::get_recent_alerts(size_t limit) const {
  std::lock_guard<std::mutex> lock(recent_alerts_mutex_);
  std::vector<Alert> alerts_copy;
  for (const auto &alert : recent_alerts_) {
    if (alerts_copy.size() >= limit)
      break;
    alerts_copy.push_back(alert);
  }
  return alerts_copy;
}

std::string
AlertManager::format_alert_to_human_readable(const Alert &alert_data) const {
  std::ostringstream out;
  out << "ALERT DETECTED:\n";
  out << "  Timestamp: "
      << Utils::format_ms_as_iso8601(alert_data.event_timestamp_ms) << "\n";
  out << "  Device:    " << alert_data.device_id << "\n";
  out << "  Type:      " << anomaly_kind_to_string(alert_data.finding.kind)
      << "\n";
  out << "  Method:    "
      << detection_method_to_string(alert_data.finding.method) << "\n";
  out << "  Severity:  " << severity_to_string(alert_data.finding.severity)
      << "\n";
  out << "  Score:     " << std::fixed << std::setprecision(3)
      << alert_data.finding.score << "\n";
  out << "  Reason:    " << alert_data.finding.message << "\n";
  out << "----------------------------------------";
  return out.str();
}

void AlertManager::dispatcher_loop() {
  auto &metrics = DetectorMetrics::instance();
  while (true) {
    std::optional<Alert> alert_opt = alert_queue_.wait_and_pop();
    if (!alert_opt)
      break;

    const Alert &alert_to_dispatch = *alert_opt;

    if (output_alerts_to_stdout_)
      std::cout << format_alert_to_human_readable(alert_to_dispatch)
                << std::endl;

    std::lock_guard<std::mutex> lock(dispatchers_mutex_);
    for (const auto &dispatcher : dispatchers_) {
      if (!dispatcher)
        continue;
      if (dispatcher->dispatch(alert_to_dispatch))
        metrics.alerts_dispatched.Increment();
      else
        LOG(LogLevel::WARN, LogComponent::IO_DISPATCH,
            dispatcher->get_name() << " failed to deliver alert for "
                                   << alert_to_dispatch.device_id);
    }
  }
  LOG(LogLevel::DEBUG, LogComponent::IO_DISPATCH,
      "Alert dispatcher thread finished.");
}
