#include "analysis/anomaly_engine.hpp"
#include "core/alert_manager.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "io/telemetry_readers/file_telemetry_reader.hpp"
#include "io/web/web_server.hpp"
#include "utils/thread_safe_queue.hpp"
#include "utils/utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

// Global atomic flags for signal handling
std::atomic<bool> g_shutdown_requested = false;
std::atomic<bool> g_reload_config_requested = false;

void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    g_shutdown_requested = true;
  else if (signum == SIGHUP)
    g_reload_config_requested = true;
}

namespace {

void log_engine_status(const AnomalyEngine &engine) {
  EngineStatus status = engine.status();
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Service Status - Data Points: "
          << status.history_size
          << ", Model Trained: " << (status.model_trained ? "true" : "false")
          << ", Last Trained: "
          << (status.last_trained_ms
                  ? Utils::format_ms_as_iso8601(*status.last_trained_ms)
                  : std::string("never")));
}

} // namespace

// --- Reader thread function ---
void telemetry_reader_thread(ITelemetryReader &reader,
                             ThreadSafeQueue<TelemetrySample> &queue,
                             uint64_t idle_sleep_seconds,
                             const std::atomic<bool> &shutdown_flag,
                             std::atomic<bool> &reader_finished) {
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Telemetry reader thread started.");
  while (!shutdown_flag && !reader.is_exhausted()) {
    std::vector<TelemetrySample> batch = reader.get_next_batch();
    if (batch.empty()) {
      if (!reader.is_exhausted())
        std::this_thread::sleep_for(std::chrono::seconds(idle_sleep_seconds));
      continue;
    }
    for (auto &sample : batch)
      if (!queue.push(std::move(sample)))
        break; // Queue shut down underneath us
  }

  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Telemetry reader thread shutting down. Rejected samples: "
          << reader.get_rejected_count());
  reader_finished = true;
  queue.shutdown();
}

// --- Worker thread function ---
void worker_thread(int worker_id, ThreadSafeQueue<TelemetrySample> &queue,
                   AnomalyEngine &engine, AlertManager &alert_manager,
                   std::atomic<uint64_t> &processed_count,
                   uint64_t status_interval) {
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Worker thread " << worker_id << " started.");

  while (true) {
    std::optional<TelemetrySample> sample_opt = queue.wait_and_pop();
    if (!sample_opt)
      break;

    const TelemetrySample &sample = *sample_opt;
    std::vector<Finding> findings = engine.ingest(sample);
    if (!findings.empty())
      alert_manager.record_findings(sample, findings);

    const uint64_t processed = ++processed_count;
    if (status_interval > 0 && processed % status_interval == 0)
      log_engine_status(engine);
  }

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Worker " << worker_id << " shutting down.");
}

int main(int argc, char *argv[]) {
  // Register all signal handlers
  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;

  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);
  sigaction(SIGHUP, &action, NULL);

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  std::string config_file_to_load = "config.ini";
  if (argc > 1)
    config_file_to_load = argv[1];
  if (!config_manager.load_configuration(config_file_to_load))
    std::cerr << "Configuration " << config_file_to_load
              << " not loaded, running with defaults." << std::endl;

  auto current_config = config_manager.get_config();

  // --- Initialize Logging ---
  LogManager::instance().configure(current_config->logging);

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Power anomaly detector starting up...");
  LOG(LogLevel::DEBUG, LogComponent::CORE, "PID: " << getpid());

  // --- Initialize Core Components ---
  AnomalyEngine engine(*current_config);
  AlertManager alert_manager;
  alert_manager.initialize(*current_config);

  // --- Telemetry Reader ---
  std::unique_ptr<ITelemetryReader> reader;
  try {
    reader = std::make_unique<FileTelemetryReader>(
        current_config->telemetry_input_path,
        current_config->live_monitoring_enabled);
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::IO_READER,
        "Could not open telemetry source: " << e.what() << ". Exiting.");
    return 1;
  }

  // --- Web Server Initialization ---
  std::unique_ptr<WebServer> web_server;
  if (current_config->monitoring.web_server_enabled) {
    auto &memory_gauge = MetricsRegistry::instance().create_gauge(
        "power_detector_memory_usage_bytes", "Resident memory in bytes");
    web_server = std::make_unique<WebServer>(
        current_config->monitoring.web_server_host,
        current_config->monitoring.web_server_port, MetricsRegistry::instance(),
        alert_manager, engine, memory_gauge);
    web_server->start();
    LOG(LogLevel::INFO, LogComponent::CORE,
        "Web server started on " << current_config->monitoring.web_server_host
                                 << ":"
                                 << current_config->monitoring.web_server_port);
  }

  // --- Central Telemetry Queue ---
  ThreadSafeQueue<TelemetrySample> telemetry_queue(
      current_config->reader_queue_capacity);
  std::atomic<bool> reader_finished{false};
  std::thread reader_thread(
      telemetry_reader_thread, std::ref(*reader), std::ref(telemetry_queue),
      current_config->live_monitoring_sleep_seconds,
      std::cref(g_shutdown_requested), std::ref(reader_finished));

  // --- Launch Worker Threads ---
  std::atomic<uint64_t> processed_count{0};
  const unsigned int num_workers = current_config->worker_threads;
  std::vector<std::thread> worker_threads;
  for (unsigned int i = 0; i < num_workers; ++i)
    worker_threads.emplace_back(
        worker_thread, static_cast<int>(i), std::ref(telemetry_queue),
        std::ref(engine), std::ref(alert_manager), std::ref(processed_count),
        current_config->status_report_interval_samples);

  auto time_start = std::chrono::steady_clock::now();

  while (!g_shutdown_requested && !reader_finished) {
    if (g_reload_config_requested.exchange(false)) {
      LOG(LogLevel::INFO, LogComponent::CORE,
          "SIGHUP detected. Reloading configuration from "
              << config_file_to_load << "...");
      if (config_manager.load_configuration(config_file_to_load)) {
        current_config = config_manager.get_config();
        LogManager::instance().configure(current_config->logging);
        alert_manager.reconfigure(*current_config);
        engine.reconfigure(*current_config);
        LOG(LogLevel::INFO, LogComponent::CONFIG,
            "All components reconfigured successfully.");
      } else
        LOG(LogLevel::ERROR, LogComponent::CONFIG,
            "Failed to reload configuration. Keeping old settings.");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  // --- Shutdown ---
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Main loop finished. Draining telemetry queue...");
  if (g_shutdown_requested)
    telemetry_queue.shutdown();

  if (reader_thread.joinable())
    reader_thread.join();

  LOG(LogLevel::INFO, LogComponent::CORE, "Joining worker threads...");
  for (auto &t : worker_threads)
    if (t.joinable())
      t.join();
  LOG(LogLevel::INFO, LogComponent::CORE, "Worker threads joined.");

  engine.wait_for_training_idle();

  if (web_server)
    web_server->stop();

  auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - time_start)
                         .count();

  LOG(LogLevel::INFO, LogComponent::CORE, "---Processing Summary---");
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Samples processed: " << processed_count.load() << " in " << duration_ms
                            << " ms");
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Alerts recorded: " << alert_manager.get_alerts_recorded()
                          << ", throttled: "
                          << alert_manager.get_alerts_throttled());
  log_engine_status(engine);
  return 0;
}
