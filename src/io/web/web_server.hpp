#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "analysis/anomaly_engine.hpp"
#include "core/alert_manager.hpp"
#include "core/metrics_registry.hpp"

#include <atomic>
#include <httplib.h>
#include <memory>
#include <prometheus/gauge.h>
#include <string>
#include <thread>

// Operations surface: Prometheus scrape endpoint, health and status, recent
// alerts, and a REST ingestion path for single samples.
class WebServer {
public:
  WebServer(const std::string &host, int port,
            MetricsRegistry &metrics_registry, AlertManager &alert_manager,
            AnomalyEngine &anomaly_engine, prometheus::Gauge &memory_gauge);
  ~WebServer();

  void start();
  void stop();

private:
  void register_routes();
  void run();
  void monitor_memory();

  std::unique_ptr<httplib::Server> server_;
  std::thread server_thread_;
  std::thread memory_monitor_thread_;
  std::atomic<bool> shutdown_flag_{false};
  std::string host_;
  int port_;
  MetricsRegistry &metrics_registry_;
  AlertManager &alert_manager_;
  AnomalyEngine &anomaly_engine_;
  prometheus::Gauge &memory_gauge_;
};

#endif // WEB_SERVER_HPP
