#ifndef ALERT_MANAGER_HPP
#define ALERT_MANAGER_HPP

#include "alert.hpp"
#include "config.hpp"
#include "io/alert_dispatch/base_dispatcher.hpp"
#include "telemetry_sample.hpp"
#include "utils/thread_safe_queue.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

// Turns findings into alerts, applies the per-device cooldown and hands the
// survivors to the dispatchers on a dedicated thread.
class AlertManager {
public:
  AlertManager();
  ~AlertManager();

  void initialize(const Config::AppConfig &app_config);
  void reconfigure(const Config::AppConfig &new_config);

  // Returns false when the alert was suppressed by the cooldown
  bool record_alert(const Alert &new_alert);

  // Wraps every finding of one ingest into an alert; returns how many passed
  size_t record_findings(const TelemetrySample &sample,
                         const std::vector<Finding> &findings);

  void add_dispatcher(std::unique_ptr<IAlertDispatcher> dispatcher);

  // Newest first
  std::vector<Alert> get_recent_alerts(size_t limit) const;

  size_t get_alerts_recorded() const { return alerts_recorded_.load(); }
  size_t get_alerts_throttled() const { return alerts_throttled_.load(); }

private:
  void dispatcher_loop();
  std::string format_alert_to_human_readable(const Alert &alert_data) const;

  std::vector<std::unique_ptr<IAlertDispatcher>> dispatchers_;
  std::mutex dispatchers_mutex_;

  ThreadSafeQueue<Alert> alert_queue_;
  std::thread dispatcher_thread_;

  std::atomic<bool> output_alerts_to_stdout_{true};
  uint64_t throttle_duration_ms_ = 0;
  std::unordered_map<std::string, uint64_t> last_alert_timestamps_;
  std::mutex throttle_mutex_;

  std::atomic<size_t> alerts_recorded_{0};
  std::atomic<size_t> alerts_throttled_{0};

  mutable std::mutex recent_alerts_mutex_;
  std::deque<Alert> recent_alerts_;
  static constexpr size_t MAX_RECENT_ALERTS = 50;
};

#endif // ALERT_MANAGER_HPP
