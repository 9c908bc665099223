#include "web_server.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <chrono>
#include <fstream>
#include <prometheus/text_serializer.h>
#include <unistd.h>

WebServer::WebServer(const std::string &host, int port,
                     MetricsRegistry &metrics_registry,
                     AlertManager &alert_manager, AnomalyEngine &anomaly_engine,
                     prometheus::Gauge &memory_gauge)
    : host_(host), port_(port), metrics_registry_(metrics_registry),
      alert_manager_(alert_manager), anomaly_engine_(anomaly_engine),
      memory_gauge_(memory_gauge) {
  server_ = std::make_unique<httplib::Server>();
  register_routes();
  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Web server initialized for " << host_ << ":" << port_);
}

void WebServer::register_routes() {
  server_->Get("/metrics", [this](const httplib::Request &req,
                                  httplib::Response &res) {
    LOG(LogLevel::DEBUG, LogComponent::IO_WEB,
        "WebServer: Received request for /metrics from " << req.remote_addr);
    prometheus::TextSerializer serializer;
    auto collected_metrics = metrics_registry_.get_registry()->Collect();
    res.set_content(serializer.Serialize(collected_metrics),
                    "text/plain; version=0.0.4");
  });

  server_->Get("/health", [](const httplib::Request &,
                             httplib::Response &res) {
    res.set_content(R"({"status":"ok"})", "application/json");
  });

  server_->Get("/api/v1/status", [this](const httplib::Request &,
                                        httplib::Response &res) {
    nlohmann::json j =
        JsonFormatter::status_to_json_object(anomaly_engine_.status());
    res.set_content(j.dump(2), "application/json");
  });

  server_->Get("/api/v1/alerts", [this](const httplib::Request &req,
                                        httplib::Response &res) {
    size_t limit = 50;
    if (req.has_param("limit")) {
      auto parsed = Utils::string_to_number<size_t>(req.get_param_value("limit"));
      if (!parsed) {
        res.status = 400;
        res.set_content(R"({"error":"limit must be a non-negative integer"})",
                        "application/json");
        return;
      }
      limit = *parsed;
    }

    nlohmann::json j = nlohmann::json::array();
    for (const auto &alert : alert_manager_.get_recent_alerts(limit))
      j.push_back(JsonFormatter::alert_to_json_object(alert));
    res.set_content(j.dump(2), "application/json");
  });

  server_->Post("/api/v1/telemetry", [this](const httplib::Request &req,
                                            httplib::Response &res) {
    try {
      TelemetrySample sample = TelemetrySample::parse_from_json(
          req.body, Utils::get_current_time_ms());
      std::vector<Finding> findings = anomaly_engine_.ingest(sample);
      alert_manager_.record_findings(sample, findings);

      nlohmann::json j;
      j["device_id"] = sample.device_id;
      j["findings"] = JsonFormatter::findings_to_json_array(findings);
      res.set_content(j.dump(2), "application/json");
    } catch (const MalformedSampleError &e) {
      DetectorMetrics::instance().samples_rejected.Increment();
      LOG(LogLevel::WARN, LogComponent::IO_WEB,
          "Rejected telemetry from " << req.remote_addr << ": " << e.what());
      nlohmann::json j;
      j["error"] = e.what();
      res.status = 400;
      res.set_content(j.dump(), "application/json");
    }
  });
}

WebServer::~WebServer() { stop(); }

void WebServer::start() {
  if (server_thread_.joinable())
    return; // Already running

  shutdown_flag_ = false;
  server_thread_ = std::thread(&WebServer::run, this);
#if defined(__linux__)
  memory_monitor_thread_ = std::thread(&WebServer::monitor_memory, this);
#endif
}

void WebServer::stop() {
  shutdown_flag_ = true;
  if (server_)
    server_->stop();

  if (server_thread_.joinable())
    server_thread_.join();
  if (memory_monitor_thread_.joinable())
    memory_monitor_thread_.join();

  LOG(LogLevel::DEBUG, LogComponent::IO_WEB, "Web server stopped.");
}

void WebServer::run() {
  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Web server starting on a background thread...");
  if (!server_->listen(host_.c_str(), port_)) {
    if (!shutdown_flag_)
      LOG(LogLevel::FATAL, LogComponent::IO_WEB,
          "Web server failed to listen on " << host_ << ":" << port_);
  }
}

#if defined(__linux__)
void WebServer::monitor_memory() {
  while (!shutdown_flag_) {
    std::ifstream statm("/proc/self/statm");
    if (statm.is_open()) {
      long long size, resident;
      statm >> size >> resident;
      long page_size = getpagesize();
      memory_gauge_.Set(static_cast<double>(resident * page_size));
    }

    for (int i = 0; i < 150; ++i) {
      if (shutdown_flag_)
        break;
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
}
#else
void WebServer::monitor_memory() {}
#endif
